#pragma once

#include "Builder/Staleness.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace weld {

namespace fs = std::filesystem;

struct SkippedFresh {
  std::string reason;
};
struct RanOk {};
struct RanFailed {
  int exitCode;
  std::string output;
};
struct StalenessError {
  std::string message;
};
struct FilesystemError {
  std::string message;
};
// A previous step of the same component failed.
struct NotRun {};

using StepOutcome = std::variant<SkippedFresh, RanOk, RanFailed,
                                 StalenessError, FilesystemError, NotRun>;

std::string_view outcomeName(const StepOutcome& outcome) noexcept;
bool isFailure(const StepOutcome& outcome) noexcept;

struct StepReport {
  std::size_t index;
  std::string command;
  fs::path workDir;
  // Unset when the step was forced or never evaluated.
  std::optional<StalenessVerdict> verdict;
  StepOutcome outcome;
};

enum class ComponentStatus : std::uint8_t {
  Succeeded,
  Failed,
  // A component it links did not succeed.
  Blocked,
  // Not dispatched after another component failed under fail-fast.
  Cancelled,
};

std::string_view toString(ComponentStatus status) noexcept;

struct ComponentReport {
  std::string component;
  ComponentStatus status = ComponentStatus::Succeeded;
  std::vector<StepReport> steps;
  // Set for blocked components.
  std::optional<std::string> blockedBy;
};

struct BuildReport {
  std::string commandName;
  std::vector<ComponentReport> components;
  double elapsedSeconds = 0.0;

  bool success() const noexcept;
  const ComponentReport* find(std::string_view component) const noexcept;
  std::size_t count(ComponentStatus status) const noexcept;

  nlohmann::json toJson() const;
  // One Diag line per component that did not succeed, then a summary.
  void log() const;
};

} // namespace weld
