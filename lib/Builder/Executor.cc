#include "Builder/Executor.hpp"

#include "Algos.hpp"
#include "Builder/Staleness.hpp"
#include "Command.hpp"
#include "Diag.hpp"
#include "Glob.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <fmt/format.h>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace weld {

static rs::Result<void> prepareDirs(const PlanStep& step) noexcept {
  for (const std::string& dir : step.command.rmdirs) {
    const fs::path path = step.workDir / dir;
    std::error_code ec;
    fs::remove_all(path, ec);
    rs_ensure(!ec, "cannot remove `{}`: {}", path.string(), ec.message());
    spdlog::debug("removed `{}`", path.string());
  }
  for (const std::string& dir : step.command.mkdirs) {
    const fs::path path = step.workDir / dir;
    std::error_code ec;
    fs::create_directories(path, ec);
    rs_ensure(!ec, "cannot create `{}`: {}", path.string(), ec.message());
    spdlog::debug("created `{}`", path.string());
  }
  return rs::Ok();
}

static void printOutput(const CommandOutput& output) {
  const std::string combined = output.stdOut + output.stdErr;
  if (!combined.empty()) {
    std::fwrite(combined.data(), 1, combined.size(), stderr);
    std::fflush(stderr);
  }
}

StepReport Executor::runStep(const ComponentPlan& plan,
                             const PlanStep& step) const {
  StepReport report{ .index = step.index,
                     .command = step.command.command,
                     .workDir = step.workDir,
                     .verdict = std::nullopt,
                     .outcome = NotRun{} };
  const std::string progress =
      fmt::format("{} (step {}/{})", plan.component, step.index + 1,
                  plan.steps.size());

  if (!options.forceBuild) {
    auto verdict = evaluateStaleness(step.command, step.workDir);
    if (verdict.is_err()) {
      report.outcome = StalenessError{ verdict.unwrap_err()->what() };
      return report;
    }
    report.verdict = std::move(verdict).unwrap();
    if (!report.verdict->isStale()) {
      Diag::info("Fresh", "{}: {}", progress, report.verdict->reason);
      report.outcome = SkippedFresh{ report.verdict->reason };
      return report;
    }
  }

  if (const auto prepared = prepareDirs(step); prepared.is_err()) {
    report.outcome = FilesystemError{ prepared.unwrap_err()->what() };
    return report;
  }

  Diag::info("Running", "{}: {}", progress, step.command.command);
  const Command cmd = Command::shell(step.command.command)
                          .setWorkingDirectory(step.workDir)
                          .setStdOutConfig(Command::IOConfig::Piped)
                          .setStdErrConfig(Command::IOConfig::Piped);
  spdlog::debug("spawning {} in `{}`", cmd, step.workDir.string());

  const auto output = cmd.output();
  if (output.is_err()) {
    report.outcome = RanFailed{ .exitCode = -1,
                                .output = output.unwrap_err()->what() };
    return report;
  }

  const CommandOutput& out = output.unwrap();
  if (out.exitStatus.success()) {
    if (options.echoOutput) {
      printOutput(out);
    }
    report.outcome = RanOk{};
  } else {
    printOutput(out);
    const int exitCode = out.exitStatus.exitedNormally()
                             ? out.exitStatus.exitCode()
                             : 128 + out.exitStatus.termSignal();
    report.outcome =
        RanFailed{ .exitCode = exitCode, .output = out.stdOut + out.stdErr };
  }
  return report;
}

ComponentReport Executor::runComponent(const ComponentPlan& plan,
                                       const std::size_t position,
                                       const std::size_t total) const {
  ComponentReport report;
  report.component = plan.component;
  Diag::info("Building", "{} [{}/{}]", plan.component, position, total);

  bool halted = false;
  for (const PlanStep& step : plan.steps) {
    if (halted) {
      report.steps.push_back(StepReport{ .index = step.index,
                                         .command = step.command.command,
                                         .workDir = step.workDir,
                                         .verdict = std::nullopt,
                                         .outcome = NotRun{} });
      continue;
    }

    StepReport stepReport = runStep(plan, step);
    if (isFailure(stepReport.outcome)) {
      halted = true;
      report.status = ComponentStatus::Failed;
    }
    report.steps.push_back(std::move(stepReport));
  }
  return report;
}

// Report for a component that never ran.
static ComponentReport skippedComponent(const ComponentPlan& plan,
                                        const ComponentStatus status) {
  ComponentReport report;
  report.component = plan.component;
  report.status = status;
  for (const PlanStep& step : plan.steps) {
    report.steps.push_back(StepReport{ .index = step.index,
                                       .command = step.command.command,
                                       .workDir = step.workDir,
                                       .verdict = std::nullopt,
                                       .outcome = NotRun{} });
  }
  return report;
}

BuildReport Executor::execute(const BuildPlan& plan) const {
  const auto start = std::chrono::steady_clock::now();

  BuildReport report;
  report.commandName = plan.commandName();

  const bool failFast = options.failurePolicy == FailurePolicy::FailFast;
  const std::size_t total = plan.componentCount();
  std::unordered_map<std::string, ComponentStatus> statuses;
  std::atomic<bool> anyFailed{ false };
  std::size_t dispatched = 0;

  for (const std::vector<ComponentPlan>& wave : plan.waves()) {
    std::vector<ComponentReport> waveReports(wave.size());

    // `statuses` only holds earlier waves here, so workers may read it.
    pool.forEach(wave.size(), [&](const std::size_t i) {
      const ComponentPlan& comp = wave[i];
      for (const std::string& prereq : comp.prerequisites) {
        if (statuses.at(prereq) != ComponentStatus::Succeeded) {
          waveReports[i] = skippedComponent(comp, ComponentStatus::Blocked);
          waveReports[i].blockedBy = prereq;
          return;
        }
      }
      if (failFast && anyFailed.load()) {
        waveReports[i] = skippedComponent(comp, ComponentStatus::Cancelled);
        return;
      }

      waveReports[i] = runComponent(comp, dispatched + i + 1, total);
      if (waveReports[i].status == ComponentStatus::Failed) {
        anyFailed.store(true);
      }
    });

    dispatched += wave.size();
    for (ComponentReport& comp : waveReports) {
      statuses.emplace(comp.component, comp.status);
      report.components.push_back(std::move(comp));
    }
  }

  const auto end = std::chrono::steady_clock::now();
  const std::chrono::duration<double> elapsed = end - start;
  report.elapsedSeconds = elapsed.count();
  return report;
}

rs::Result<void> cleanArtifacts(const std::vector<ResolvedComponent>& components,
                                const std::optional<fs::path>& tempDir) noexcept {
  const auto removePath = [](const fs::path& path) -> rs::Result<void> {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
      spdlog::trace("`{}` does not exist; nothing to remove", path.string());
      return rs::Ok();
    }
    Diag::info("Removing", "{}", path.string());
    fs::remove_all(path, ec);
    rs_ensure(!ec, "cannot remove `{}`: {}", path.string(), ec.message());
    return rs::Ok();
  };

  for (const ResolvedComponent& comp : components) {
    const ComponentProperties& props = comp.properties;
    for (const auto* artifact :
         { &props.generatedWit, &props.componentWasm, &props.linkedWasm }) {
      if (artifact->has_value()) {
        rs_try(removePath(comp.baseDir / **artifact));
      }
    }
    for (const std::string& pattern :
         props.clean.value_or(std::vector<std::string>{})) {
      const std::vector<fs::path> matches =
          rs_try(expandGlob(comp.baseDir, pattern));
      for (const fs::path& path : matches) {
        rs_try(removePath(path));
      }
    }
  }
  if (tempDir.has_value()) {
    rs_try(removePath(*tempDir));
  }
  return rs::Ok();
}

} // namespace weld
