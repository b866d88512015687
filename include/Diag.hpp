#pragma once

#include "TermColor.hpp"

#include <cstdint>
#include <cstdio>
#include <fmt/core.h>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <utility>

namespace weld {

enum class DiagLevel : std::uint8_t {
  Off = 0,
  Error = 1,
  Warn = 2,
  Info = 3,
};

// User-facing status lines on stderr.  Debug output goes through spdlog.
class Diag {
  DiagLevel level = DiagLevel::Info;

  Diag() noexcept = default;

  static Diag& instance() noexcept {
    static Diag instance;
    return instance;
  }

  static void emit(const std::string& line) noexcept {
    // One write per line keeps lines from parallel workers intact.
    std::fwrite(line.data(), 1, line.size(), stderr);
    std::fflush(stderr);
  }

public:
  Diag(const Diag&) = delete;
  Diag& operator=(const Diag&) = delete;
  Diag(Diag&&) noexcept = delete;
  Diag& operator=(Diag&&) noexcept = delete;
  ~Diag() noexcept = default;

  static void setLevel(const DiagLevel level) noexcept {
    instance().level = level;
  }
  static DiagLevel getLevel() noexcept { return instance().level; }

  template <typename... Args>
  static void error(fmt::format_string<Args...> fmt, Args&&... args) noexcept {
    if (getLevel() < DiagLevel::Error) {
      return;
    }
    emit(fmt::format("{} {}\n", bold(red("Error:")),
                     fmt::format(fmt, std::forward<Args>(args)...)));
  }

  template <typename... Args>
  static void warn(fmt::format_string<Args...> fmt, Args&&... args) noexcept {
    if (getLevel() < DiagLevel::Warn) {
      return;
    }
    emit(fmt::format("{} {}\n", bold(yellow("Warning:")),
                     fmt::format(fmt, std::forward<Args>(args)...)));
  }

  template <typename... Args>
  static void info(const std::string_view header,
                   fmt::format_string<Args...> fmt, Args&&... args) noexcept {
    if (getLevel() < DiagLevel::Info) {
      return;
    }
    emit(fmt::format("{} {}\n", bold(green(fmt::format("{:>12}", header))),
                     fmt::format(fmt, std::forward<Args>(args)...)));
  }
};

} // namespace weld
