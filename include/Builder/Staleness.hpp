#pragma once

#include "Manifest.hpp"

#include <cstdint>
#include <filesystem>
#include <rs/result.hpp>
#include <string>

namespace weld {

namespace fs = std::filesystem;

enum class Freshness : std::uint8_t {
  Stale,
  Fresh,
};

struct StalenessVerdict {
  Freshness freshness;
  // Why, for logs and the report.
  std::string reason;

  bool isStale() const noexcept { return freshness == Freshness::Stale; }
};

// Patterns are expanded relative to `workDir`.  A matched directory counts
// with its own mtime and that of everything beneath it.  Fails when a
// source pattern matches nothing.
rs::Result<StalenessVerdict> evaluateStaleness(const ExternalCommand& cmd,
                                               const fs::path& workDir) noexcept;

} // namespace weld
