#include "Builder/Builder.hpp"

#include "Algos.hpp"
#include "Diag.hpp"

#include <fmt/format.h>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace weld {

rs::Result<void> Builder::schedule(const std::optional<BuildProfile>& profile) {
  const Resolver resolver = rs_try(Resolver::create(mf));
  resolved = rs_try(resolver.resolveAll(profile));
  graphState.emplace(rs_try(DepGraph::create(resolved)));

  if (profile.has_value()) {
    Diag::info("Resolved", "{} with profile `{}`",
               plural(resolved.size(), "component"), *profile);
  } else {
    Diag::info("Resolved", "{}", plural(resolved.size(), "component"));
  }
  return rs::Ok();
}

rs::Result<void> Builder::ensureScheduled() const {
  rs_ensure(graphState.has_value(), "builder.schedule() must be called first");
  return rs::Ok();
}

const DepGraph& Builder::graph() const {
  if (!graphState) {
    throw std::logic_error("builder.schedule() must be called first");
  }
  return *graphState;
}

rs::Result<BuildReport>
Builder::build(WorkerPool& pool, const ExecuteOptions& options,
               const std::vector<std::string>& selection) const {
  rs_try(ensureScheduled());
  const BuildPlan plan =
      rs_try(BuildPlan::create(*graphState, resolved, selection));
  Diag::info("Planned", "{} in {} wave(s) with {} worker(s)",
             plural(plan.stepCount(), "step"), plan.waves().size(),
             pool.concurrency());

  BuildReport report = Executor(pool, options).execute(plan);
  report.log();
  return rs::Ok(std::move(report));
}

rs::Result<BuildReport>
Builder::exec(const std::string& name, WorkerPool& pool,
              const ExecuteOptions& options,
              const std::vector<std::string>& selection) const {
  rs_try(ensureScheduled());
  const BuildPlan plan = rs_try(
      BuildPlan::forCustomCommand(*graphState, resolved, name, selection));
  Diag::info("Planned", "`{}` on {}", name,
             plural(plan.componentCount(), "component"));

  BuildReport report = Executor(pool, options).execute(plan);
  report.log();
  return rs::Ok(std::move(report));
}

rs::Result<void>
Builder::clean(const std::vector<std::string>& selection) const {
  rs_try(ensureScheduled());

  std::vector<ResolvedComponent> targets;
  if (selection.empty()) {
    targets = resolved;
  } else {
    for (const std::string& name : selection) {
      rs_ensure(graphState->indexOf(name).has_value(),
                "unknown component `{}`", name);
      targets.push_back(resolved[*graphState->indexOf(name)]);
    }
  }

  std::optional<fs::path> tempDir;
  if (selection.empty()) {
    tempDir = mf.tempDirPath();
  }
  rs_try(cleanArtifacts(targets, tempDir));
  Diag::info("Cleaned", "{}", plural(targets.size(), "component"));
  return rs::Ok();
}

} // namespace weld
