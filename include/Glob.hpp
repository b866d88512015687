#pragma once

#include <filesystem>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace weld {

namespace fs = std::filesystem;

// Pattern syntax, matched per `/`-separated segment:
//   *      any run of characters within one segment
//   ?      one character within one segment
//   [a-z]  character class; `[!...]` negates
//   **     zero or more whole segments
bool isGlobPattern(std::string_view pattern) noexcept;
bool matchGlob(std::string_view pattern, std::string_view path) noexcept;

// Expands `pattern` relative to `baseDir` (absolute patterns are kept as is).
// A pattern without metacharacters yields the path itself if it exists.
// Results are sorted and never contain duplicates; an empty result means
// nothing matched.
rs::Result<std::vector<fs::path>> expandGlob(const fs::path& baseDir,
                                             const std::string& pattern);

} // namespace weld
