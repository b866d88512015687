#pragma once

#include <fmt/format.h>
#include <string>
#include <string_view>
#include <utility>

namespace weld {

// Name of a component profile, as selected with `--profile`.  Profiles are
// declared per component or template, so any name is accepted here and
// checked during resolution.
class BuildProfile {
  friend struct fmt::formatter<BuildProfile>;

  std::string name;

public:
  explicit BuildProfile(std::string name) : name(std::move(name)) {}

  const std::string& str() const noexcept { return name; }

  bool operator==(const BuildProfile& other) const = default;
  bool operator==(const std::string_view other) const { return name == other; }
};

} // namespace weld

template <>
struct fmt::formatter<weld::BuildProfile> {
  // NOLINTNEXTLINE(*-static)
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const weld::BuildProfile& buildProfile,
              FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", buildProfile.name);
  }
};
