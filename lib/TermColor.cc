#include "TermColor.hpp"

#include <cstdio>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <unistd.h>

namespace weld {

static ColorMode initColorMode() noexcept {
  const char* env = std::getenv("WELD_TERM_COLOR");
  if (env == nullptr) {
    return ColorMode::Auto;
  }

  const std::string_view value = env;
  if (value == "always") {
    return ColorMode::Always;
  } else if (value == "never") {
    return ColorMode::Never;
  } else if (value != "auto") {
    spdlog::warn("unknown WELD_TERM_COLOR value `{}`; using `auto`", value);
  }
  return ColorMode::Auto;
}

static ColorMode& colorModeRef() noexcept {
  static ColorMode mode = initColorMode();
  return mode;
}

void setColorMode(const std::string_view str) noexcept {
  if (str == "always") {
    colorModeRef() = ColorMode::Always;
  } else if (str == "never") {
    colorModeRef() = ColorMode::Never;
  } else {
    colorModeRef() = ColorMode::Auto;
  }
}

ColorMode getColorMode() noexcept { return colorModeRef(); }

bool shouldColorStderr() noexcept {
  switch (getColorMode()) {
  case ColorMode::Always:
    return true;
  case ColorMode::Never:
    return false;
  case ColorMode::Auto:
    return isatty(fileno(stderr)) != 0;
  }
  return false;
}

static std::string colorize(const std::string_view str,
                            const std::string_view code) noexcept {
  if (!shouldColorStderr()) {
    return std::string(str);
  }

  std::string result;
  result.reserve(str.size() + code.size() + 8);
  result.append("\033[");
  result.append(code);
  result.push_back('m');
  result.append(str);
  result.append("\033[0m");
  return result;
}

std::string gray(const std::string_view str) noexcept {
  return colorize(str, "90");
}
std::string red(const std::string_view str) noexcept {
  return colorize(str, "31");
}
std::string green(const std::string_view str) noexcept {
  return colorize(str, "32");
}
std::string yellow(const std::string_view str) noexcept {
  return colorize(str, "33");
}
std::string cyan(const std::string_view str) noexcept {
  return colorize(str, "36");
}
std::string bold(const std::string_view str) noexcept {
  return colorize(str, "1");
}

} // namespace weld
