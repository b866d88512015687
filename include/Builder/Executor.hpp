#pragma once

#include "Builder/BuildPlan.hpp"
#include "Builder/BuildReport.hpp"
#include "Builder/Resolver.hpp"
#include "Parallelism.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <rs/result.hpp>
#include <vector>

namespace weld {

namespace fs = std::filesystem;

enum class FailurePolicy : std::uint8_t {
  // Keep dispatching components that do not depend on the failure.
  KeepGoing,
  // Dispatch nothing new after the first failure; running ones finish.
  FailFast,
};

struct ExecuteOptions {
  // Run every step without checking staleness.
  bool forceBuild = false;
  FailurePolicy failurePolicy = FailurePolicy::KeepGoing;
  // Print the output of successful steps as well as failed ones (`-v`).
  bool echoOutput = false;
};

class Executor {
public:
  Executor(WorkerPool& pool, ExecuteOptions options) noexcept
      : pool(pool), options(options) {}

  // Step failures end up in the report rather than in an error.
  BuildReport execute(const BuildPlan& plan) const;

private:
  WorkerPool& pool;
  ExecuteOptions options;

  ComponentReport runComponent(const ComponentPlan& plan,
                               std::size_t position, std::size_t total) const;
  StepReport runStep(const ComponentPlan& plan, const PlanStep& step) const;
};

// Removes the generated artifacts of `components` (generatedWit,
// componentWasm, linkedWasm, and clean paths, relative to each component's
// base directory), then `tempDir` when given.
rs::Result<void> cleanArtifacts(const std::vector<ResolvedComponent>& components,
                                const std::optional<fs::path>& tempDir) noexcept;

} // namespace weld
