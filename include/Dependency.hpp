#pragma once

#include <cstdint>
#include <fmt/format.h>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <utility>

namespace weld {

enum class DependencyType : std::uint8_t {
  // Calls the target through a dynamically linked RPC stub.
  WasmRpc,
  // Calls the target through an RPC stub composed into the caller.
  StaticWasmRpc,
  // Links the target's finished component binary into the caller.
  Wasm,
};

rs::Result<DependencyType> parseDependencyType(std::string_view str) noexcept;
std::string_view toString(DependencyType type) noexcept;

// RPC dependencies only need the target's WIT interface, which exists before
// the target is built, so they impose no build order.
constexpr bool needsTargetBinary(const DependencyType type) noexcept {
  return type == DependencyType::Wasm;
}

struct ComponentDependency {
  DependencyType type = DependencyType::WasmRpc;
  std::string target;

  ComponentDependency() = default;
  ComponentDependency(DependencyType type, std::string target)
      : type(type), target(std::move(target)) {}

  static ComponentDependency wasmRpc(std::string target) {
    return { DependencyType::WasmRpc, std::move(target) };
  }

  bool operator==(const ComponentDependency&) const = default;
};

} // namespace weld

template <>
struct fmt::formatter<weld::DependencyType> : formatter<std::string_view> {
  auto format(const weld::DependencyType type, format_context& ctx) const {
    return formatter<std::string_view>::format(weld::toString(type), ctx);
  }
};
