#pragma once

#include "Builder/DepGraph.hpp"
#include "Builder/Resolver.hpp"
#include "Manifest.hpp"

#include <cstddef>
#include <filesystem>
#include <rs/result.hpp>
#include <string>
#include <vector>

namespace weld {

namespace fs = std::filesystem;

// `baseDir / dir` when the command sets `dir`, otherwise `baseDir`.
fs::path commandWorkDir(const fs::path& baseDir, const ExternalCommand& cmd);

struct PlanStep {
  // Zero-based position within the component.
  std::size_t index;
  ExternalCommand command;
  fs::path workDir;
};

struct ComponentPlan {
  std::string component;
  std::vector<PlanStep> steps;
  // Planned components whose binaries this one links.
  std::vector<std::string> prerequisites;
};

// Components grouped into waves: every component's prerequisites sit in an
// earlier wave, and components within a wave keep declaration order.
class BuildPlan {
public:
  // Plans the `build` steps of `selection` plus everything they link; an
  // empty selection plans every component.
  static rs::Result<BuildPlan>
  create(const DepGraph& graph, const std::vector<ResolvedComponent>& components,
         const std::vector<std::string>& selection = {}) noexcept;

  // Plans custom command `name` on the components that define it.
  static rs::Result<BuildPlan>
  forCustomCommand(const DepGraph& graph,
                   const std::vector<ResolvedComponent>& components,
                   const std::string& name,
                   const std::vector<std::string>& selection = {}) noexcept;

  const std::string& commandName() const noexcept { return name; }
  const std::vector<std::vector<ComponentPlan>>& waves() const noexcept {
    return waveList;
  }
  std::size_t componentCount() const noexcept;
  std::size_t stepCount() const noexcept;

private:
  BuildPlan() = default;

  std::string name;
  std::vector<std::vector<ComponentPlan>> waveList;
};

} // namespace weld
