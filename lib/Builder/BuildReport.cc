#include "Builder/BuildReport.hpp"

#include "Algos.hpp"
#include "Diag.hpp"

#include <algorithm>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <variant>

namespace weld {

std::string_view outcomeName(const StepOutcome& outcome) noexcept {
  return std::visit(Overloaded{
                        [](const SkippedFresh&) { return "skipped-fresh"; },
                        [](const RanOk&) { return "ran-ok"; },
                        [](const RanFailed&) { return "ran-failed"; },
                        [](const StalenessError&) { return "staleness-error"; },
                        [](const FilesystemError&) {
                          return "filesystem-error";
                        },
                        [](const NotRun&) { return "not-run"; },
                    },
                    outcome);
}

bool isFailure(const StepOutcome& outcome) noexcept {
  return std::holds_alternative<RanFailed>(outcome)
         || std::holds_alternative<StalenessError>(outcome)
         || std::holds_alternative<FilesystemError>(outcome);
}

std::string_view toString(const ComponentStatus status) noexcept {
  switch (status) {
  case ComponentStatus::Succeeded:
    return "succeeded";
  case ComponentStatus::Failed:
    return "failed";
  case ComponentStatus::Blocked:
    return "blocked";
  case ComponentStatus::Cancelled:
    return "cancelled";
  }
  __builtin_unreachable();
}

bool BuildReport::success() const noexcept {
  return std::ranges::all_of(components, [](const ComponentReport& comp) {
    return comp.status == ComponentStatus::Succeeded;
  });
}

const ComponentReport*
BuildReport::find(const std::string_view component) const noexcept {
  const auto itr =
      std::ranges::find_if(components, [component](const ComponentReport& c) {
        return c.component == component;
      });
  return itr == components.end() ? nullptr : &*itr;
}

std::size_t BuildReport::count(const ComponentStatus status) const noexcept {
  return static_cast<std::size_t>(
      std::ranges::count_if(components, [status](const ComponentReport& c) {
        return c.status == status;
      }));
}

static nlohmann::json stepToJson(const StepReport& step) {
  nlohmann::json json{
    { "index", step.index },
    { "command", step.command },
    { "dir", step.workDir.string() },
    { "outcome", outcomeName(step.outcome) },
  };
  if (step.verdict.has_value()) {
    json["stale"] = step.verdict->isStale();
    json["reason"] = step.verdict->reason;
  }
  std::visit(Overloaded{
                 [](const SkippedFresh&) {},
                 [](const RanOk&) {},
                 [&](const RanFailed& failed) {
                   json["exitCode"] = failed.exitCode;
                   json["output"] = failed.output;
                 },
                 [&](const StalenessError& err) {
                   json["message"] = err.message;
                 },
                 [&](const FilesystemError& err) {
                   json["message"] = err.message;
                 },
                 [](const NotRun&) {},
             },
             step.outcome);
  return json;
}

nlohmann::json BuildReport::toJson() const {
  nlohmann::json comps = nlohmann::json::array();
  for (const ComponentReport& comp : components) {
    nlohmann::json steps = nlohmann::json::array();
    for (const StepReport& step : comp.steps) {
      steps.push_back(stepToJson(step));
    }

    nlohmann::json json{
      { "name", comp.component },
      { "status", toString(comp.status) },
      { "steps", std::move(steps) },
    };
    if (comp.blockedBy.has_value()) {
      json["blockedBy"] = *comp.blockedBy;
    }
    comps.push_back(std::move(json));
  }

  return nlohmann::json{
    { "command", commandName },
    { "success", success() },
    { "elapsedSeconds", elapsedSeconds },
    { "components", std::move(comps) },
  };
}

void BuildReport::log() const {
  for (const ComponentReport& comp : components) {
    switch (comp.status) {
    case ComponentStatus::Succeeded:
      break;
    case ComponentStatus::Failed:
      for (const StepReport& step : comp.steps) {
        if (const auto* failed = std::get_if<RanFailed>(&step.outcome)) {
          Diag::error("`{}` step {} failed with exit code {}: {}",
                      comp.component, step.index + 1, failed->exitCode,
                      step.command);
        } else if (const auto* err = std::get_if<StalenessError>(&step.outcome)) {
          Diag::error("`{}` step {}: {}", comp.component, step.index + 1,
                      err->message);
        } else if (const auto* err =
                       std::get_if<FilesystemError>(&step.outcome)) {
          Diag::error("`{}` step {}: {}", comp.component, step.index + 1,
                      err->message);
        }
      }
      break;
    case ComponentStatus::Blocked:
      Diag::warn("`{}` was not built: `{}` did not succeed", comp.component,
                 comp.blockedBy.value_or("a prerequisite"));
      break;
    case ComponentStatus::Cancelled:
      Diag::warn("`{}` was cancelled", comp.component);
      break;
    }
  }

  if (success()) {
    Diag::info("Finished", "`{}` for {} in {:.2f}s", commandName,
               plural(components.size(), "component"), elapsedSeconds);
  } else {
    Diag::error("`{}` failed: {} succeeded; {} failed; {} blocked; {} "
                "cancelled",
                commandName, count(ComponentStatus::Succeeded),
                count(ComponentStatus::Failed), count(ComponentStatus::Blocked),
                count(ComponentStatus::Cancelled));
  }
}

} // namespace weld
