#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace weld {

enum class ColorMode : std::uint8_t {
  Always,
  Auto,
  Never,
};

// Accepts `always`, `auto`, or `never`; anything else falls back to `auto`.
void setColorMode(std::string_view str) noexcept;
ColorMode getColorMode() noexcept;
bool shouldColorStderr() noexcept;

std::string gray(std::string_view str) noexcept;
std::string red(std::string_view str) noexcept;
std::string green(std::string_view str) noexcept;
std::string yellow(std::string_view str) noexcept;
std::string cyan(std::string_view str) noexcept;
std::string bold(std::string_view str) noexcept;

} // namespace weld
