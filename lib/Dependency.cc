#include "Dependency.hpp"

#include <rs/result.hpp>
#include <string_view>

namespace weld {

rs::Result<DependencyType>
parseDependencyType(const std::string_view str) noexcept {
  if (str == "wasm-rpc") {
    return rs::Ok(DependencyType::WasmRpc);
  } else if (str == "static-wasm-rpc") {
    return rs::Ok(DependencyType::StaticWasmRpc);
  } else if (str == "wasm") {
    return rs::Ok(DependencyType::Wasm);
  }
  rs_bail("unknown dependency type `{}` (expected `wasm-rpc`, "
          "`static-wasm-rpc`, or `wasm`)",
          str);
}

std::string_view toString(const DependencyType type) noexcept {
  switch (type) {
  case DependencyType::WasmRpc:
    return "wasm-rpc";
  case DependencyType::StaticWasmRpc:
    return "static-wasm-rpc";
  case DependencyType::Wasm:
    return "wasm";
  }
  __builtin_unreachable();
}

} // namespace weld
