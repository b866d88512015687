#pragma once

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace weld {

template <typename... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

inline bool matchesAny(const std::string_view arg,
                       const std::initializer_list<std::string_view> options) {
  for (const std::string_view option : options) {
    if (arg == option) {
      return true;
    }
  }
  return false;
}

// `1 step`, `2 steps`
inline std::string plural(const std::size_t count, const std::string_view noun) {
  return fmt::format("{} {}{}", count, noun, count == 1 ? "" : "s");
}

} // namespace weld
