#pragma once

#include "Builder/BuildPlan.hpp"
#include "Builder/BuildProfile.hpp"
#include "Builder/BuildReport.hpp"
#include "Builder/DepGraph.hpp"
#include "Builder/Executor.hpp"
#include "Builder/Resolver.hpp"
#include "Manifest.hpp"
#include "Parallelism.hpp"

#include <optional>
#include <rs/result.hpp>
#include <string>
#include <vector>

namespace weld {

// Runs a loaded manifest through resolution, graph construction, planning
// and execution.
class Builder {
public:
  explicit Builder(Manifest manifest) noexcept : mf(std::move(manifest)) {}

  // Resolves every component for `profile` and builds the dependency graph.
  // Must succeed before anything else is called.
  rs::Result<void> schedule(const std::optional<BuildProfile>& profile);

  // Plans and runs `build` for `selection` (every component when empty).
  rs::Result<BuildReport> build(WorkerPool& pool, const ExecuteOptions& options,
                                const std::vector<std::string>& selection = {})
      const;
  // Plans and runs custom command `name`.
  rs::Result<BuildReport> exec(const std::string& name, WorkerPool& pool,
                               const ExecuteOptions& options,
                               const std::vector<std::string>& selection = {})
      const;
  // Removes build artifacts; the temp dir goes too when nothing is selected.
  rs::Result<void> clean(const std::vector<std::string>& selection = {}) const;

  const Manifest& manifest() const noexcept { return mf; }
  const std::vector<ResolvedComponent>& components() const noexcept {
    return resolved;
  }
  const DepGraph& graph() const;

private:
  Manifest mf;
  std::vector<ResolvedComponent> resolved;
  std::optional<DepGraph> graphState;

  rs::Result<void> ensureScheduled() const;
};

} // namespace weld
