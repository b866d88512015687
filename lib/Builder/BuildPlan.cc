#include "Builder/BuildPlan.hpp"

#include <algorithm>
#include <cstddef>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace weld {

fs::path commandWorkDir(const fs::path& baseDir, const ExternalCommand& cmd) {
  if (cmd.dir.has_value()) {
    return (baseDir / *cmd.dir).lexically_normal();
  }
  return baseDir;
}

static rs::Result<std::vector<bool>>
selectNodes(const DepGraph& graph, const std::vector<std::string>& selection,
            const bool withPrerequisites) noexcept {
  if (selection.empty()) {
    return rs::Ok(std::vector<bool>(graph.size(), true));
  }

  std::vector<bool> selected(graph.size(), false);
  std::vector<std::size_t> pending;
  for (const std::string& name : selection) {
    const auto idx = graph.indexOf(name);
    rs_ensure(idx.has_value(), "unknown component `{}`", name);
    if (!selected[*idx]) {
      selected[*idx] = true;
      pending.push_back(*idx);
    }
  }

  while (withPrerequisites && !pending.empty()) {
    const std::size_t idx = pending.back();
    pending.pop_back();
    for (const std::size_t succ : graph.successors(idx, /*binaryOnly=*/true)) {
      if (!selected[succ]) {
        spdlog::debug("`{}` links `{}`; planning it too", graph.name(idx),
                      graph.name(succ));
        selected[succ] = true;
        pending.push_back(succ);
      }
    }
  }
  return rs::Ok(std::move(selected));
}

// Kahn's algorithm over the binary edges among `included` nodes, one level
// per wave.
static rs::Result<std::vector<std::vector<std::size_t>>>
computeWaves(const DepGraph& graph, const std::vector<bool>& included) noexcept {
  std::vector<std::size_t> pendingPrereqs(graph.size(), 0);
  std::vector<std::vector<std::size_t>> dependents(graph.size());
  std::size_t numIncluded = 0;
  for (std::size_t idx = 0; idx < graph.size(); ++idx) {
    if (!included[idx]) {
      continue;
    }
    ++numIncluded;
    for (const std::size_t succ : graph.successors(idx, /*binaryOnly=*/true)) {
      if (included[succ]) {
        ++pendingPrereqs[idx];
        dependents[succ].push_back(idx);
      }
    }
  }

  std::vector<std::vector<std::size_t>> waves;
  std::vector<std::size_t> current;
  for (std::size_t idx = 0; idx < graph.size(); ++idx) {
    if (included[idx] && pendingPrereqs[idx] == 0) {
      current.push_back(idx);
    }
  }

  std::size_t numPlanned = 0;
  while (!current.empty()) {
    std::vector<std::size_t> next;
    for (const std::size_t idx : current) {
      for (const std::size_t dependent : dependents[idx]) {
        if (--pendingPrereqs[dependent] == 0) {
          next.push_back(dependent);
        }
      }
    }
    std::ranges::sort(next);
    numPlanned += current.size();
    waves.push_back(std::move(current));
    current = std::move(next);
  }

  if (numPlanned != numIncluded) {
    std::vector<std::string_view> stuck;
    for (std::size_t idx = 0; idx < graph.size(); ++idx) {
      if (included[idx] && pendingPrereqs[idx] > 0) {
        stuck.emplace_back(graph.name(idx));
      }
    }
    rs_bail("cycle among `wasm` dependencies: {}", fmt::join(stuck, ", "));
  }
  return rs::Ok(std::move(waves));
}

static ComponentPlan planComponent(const DepGraph& graph,
                                   const std::vector<bool>& included,
                                   const std::size_t idx,
                                   const ResolvedComponent& comp,
                                   const std::vector<ExternalCommand>& cmds) {
  ComponentPlan plan;
  plan.component = comp.name;
  for (std::size_t i = 0; i < cmds.size(); ++i) {
    plan.steps.push_back(PlanStep{ .index = i,
                                   .command = cmds[i],
                                   .workDir = commandWorkDir(comp.baseDir,
                                                             cmds[i]) });
  }
  for (const std::size_t succ : graph.successors(idx, /*binaryOnly=*/true)) {
    if (included[succ]) {
      plan.prerequisites.push_back(graph.name(succ));
    }
  }
  return plan;
}

rs::Result<BuildPlan>
BuildPlan::create(const DepGraph& graph,
                  const std::vector<ResolvedComponent>& components,
                  const std::vector<std::string>& selection) noexcept {
  rs_ensure(graph.size() == components.size(),
            "dependency graph does not match the resolved components");

  const std::vector<bool> included =
      rs_try(selectNodes(graph, selection, /*withPrerequisites=*/true));
  const auto waves = rs_try(computeWaves(graph, included));

  BuildPlan plan;
  plan.name = "build";
  for (const auto& wave : waves) {
    std::vector<ComponentPlan> compPlans;
    for (const std::size_t idx : wave) {
      const ResolvedComponent& comp = components[idx];
      compPlans.push_back(planComponent(
          graph, included, idx, comp,
          comp.properties.build.value_or(std::vector<ExternalCommand>{})));
    }
    plan.waveList.push_back(std::move(compPlans));
  }

  spdlog::debug("planned {} component(s) in {} wave(s)", plan.componentCount(),
                plan.waveList.size());
  return rs::Ok(std::move(plan));
}

rs::Result<BuildPlan> BuildPlan::forCustomCommand(
    const DepGraph& graph, const std::vector<ResolvedComponent>& components,
    const std::string& name, const std::vector<std::string>& selection) noexcept {
  rs_ensure(graph.size() == components.size(),
            "dependency graph does not match the resolved components");

  std::vector<bool> included =
      rs_try(selectNodes(graph, selection, /*withPrerequisites=*/false));
  bool anyDefines = false;
  for (std::size_t idx = 0; idx < components.size(); ++idx) {
    if (!components[idx].properties.customCommands.contains(name)) {
      included[idx] = false;
    }
    anyDefines = anyDefines || included[idx];
  }
  rs_ensure(anyDefines, "no selected component defines custom command `{}`",
            name);

  const auto waves = rs_try(computeWaves(graph, included));

  BuildPlan plan;
  plan.name = name;
  for (const auto& wave : waves) {
    std::vector<ComponentPlan> compPlans;
    for (const std::size_t idx : wave) {
      const ResolvedComponent& comp = components[idx];
      compPlans.push_back(planComponent(graph, included, idx, comp,
                                        comp.properties.customCommands.at(name)));
    }
    plan.waveList.push_back(std::move(compPlans));
  }
  return rs::Ok(std::move(plan));
}

std::size_t BuildPlan::componentCount() const noexcept {
  std::size_t count = 0;
  for (const auto& wave : waveList) {
    count += wave.size();
  }
  return count;
}

std::size_t BuildPlan::stepCount() const noexcept {
  std::size_t count = 0;
  for (const auto& wave : waveList) {
    for (const ComponentPlan& comp : wave) {
      count += comp.steps.size();
    }
  }
  return count;
}

} // namespace weld
