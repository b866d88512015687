#include "Glob.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace weld {

static std::vector<std::string_view> splitSegments(const std::string_view path) {
  std::vector<std::string_view> segments;
  std::size_t start = 0;
  while (start <= path.size()) {
    std::size_t end = path.find('/', start);
    if (end == std::string_view::npos) {
      end = path.size();
    }
    const std::string_view segment = path.substr(start, end - start);
    if (!segment.empty() && segment != ".") {
      segments.push_back(segment);
    }
    start = end + 1;
  }
  return segments;
}

bool isGlobPattern(const std::string_view pattern) noexcept {
  return pattern.find_first_of("*?[") != std::string_view::npos;
}

// Matches `[...]` starting at pattern[pi] against `c`.  On success, `pi` is
// left just past the closing bracket.
static bool matchClass(const std::string_view pattern, std::size_t& pi,
                       const char c, bool& matched) noexcept {
  std::size_t i = pi + 1;
  bool negate = false;
  if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
    negate = true;
    ++i;
  }

  bool found = false;
  bool first = true;
  while (i < pattern.size() && (first || pattern[i] != ']')) {
    first = false;
    const char lo = pattern[i];
    if (i + 2 < pattern.size() && pattern[i + 1] == '-'
        && pattern[i + 2] != ']') {
      const char hi = pattern[i + 2];
      if (lo <= c && c <= hi) {
        found = true;
      }
      i += 3;
    } else {
      if (lo == c) {
        found = true;
      }
      ++i;
    }
  }
  if (i >= pattern.size()) {
    // Unterminated class: treat `[` literally.
    return false;
  }

  pi = i + 1;
  matched = found != negate;
  return true;
}

static bool matchSegment(const std::string_view pattern,
                         const std::string_view str) noexcept {
  std::size_t pi = 0;
  std::size_t si = 0;
  std::size_t starPi = std::string_view::npos;
  std::size_t starSi = 0;

  while (si < str.size()) {
    if (pi < pattern.size() && pattern[pi] == '*') {
      starPi = pi++;
      starSi = si;
      continue;
    }

    if (pi < pattern.size()) {
      if (pattern[pi] == '?') {
        ++pi;
        ++si;
        continue;
      }
      if (pattern[pi] == '[') {
        std::size_t next = pi;
        bool matched = false;
        if (matchClass(pattern, next, str[si], matched)) {
          if (matched) {
            pi = next;
            ++si;
            continue;
          }
        } else if (str[si] == '[') {
          ++pi;
          ++si;
          continue;
        }
      } else if (pattern[pi] == str[si]) {
        ++pi;
        ++si;
        continue;
      }
    }

    if (starPi == std::string_view::npos) {
      return false;
    }
    pi = starPi + 1;
    si = ++starSi;
  }

  while (pi < pattern.size() && pattern[pi] == '*') {
    ++pi;
  }
  return pi == pattern.size();
}

static bool // NOLINTNEXTLINE(misc-no-recursion)
matchSegments(const std::vector<std::string_view>& patterns,
              const std::size_t pi,
              const std::vector<std::string_view>& segments,
              const std::size_t si) noexcept {
  if (pi == patterns.size()) {
    return si == segments.size();
  }
  if (patterns[pi] == "**") {
    for (std::size_t k = si; k <= segments.size(); ++k) {
      if (matchSegments(patterns, pi + 1, segments, k)) {
        return true;
      }
    }
    return false;
  }
  if (si == segments.size()) {
    return false;
  }
  return matchSegment(patterns[pi], segments[si])
         && matchSegments(patterns, pi + 1, segments, si + 1);
}

bool matchGlob(const std::string_view pattern,
               const std::string_view path) noexcept {
  return matchSegments(splitSegments(pattern), 0, splitSegments(path), 0);
}

rs::Result<std::vector<fs::path>> expandGlob(const fs::path& baseDir,
                                             const std::string& pattern) {
  const bool isAbsolute = fs::path(pattern).is_absolute();
  std::error_code ec;

  if (!isGlobPattern(pattern)) {
    const fs::path literal =
        (isAbsolute ? fs::path(pattern) : baseDir / pattern).lexically_normal();
    if (fs::exists(literal, ec)) {
      return rs::Ok(std::vector<fs::path>{ literal });
    }
    return rs::Ok(std::vector<fs::path>{});
  }

  const std::vector<std::string_view> segments = splitSegments(pattern);
  fs::path root = isAbsolute ? fs::path(pattern).root_path() : baseDir;
  std::size_t firstWild = 0;
  while (firstWild < segments.size() && !isGlobPattern(segments[firstWild])) {
    root /= segments[firstWild];
    ++firstWild;
  }

  const std::vector<std::string_view> rest(segments.begin() + firstWild,
                                           segments.end());
  const bool recursive = std::ranges::find(rest, "**") != rest.end();

  std::vector<fs::path> matches;
  if (!fs::is_directory(root, ec)) {
    spdlog::trace("glob `{}`: `{}` is not a directory", pattern,
                  root.string());
    return rs::Ok(matches);
  }

  fs::recursive_directory_iterator it(
      root, fs::directory_options::skip_permission_denied, ec);
  rs_ensure(!ec, "cannot read directory `{}`: {}", root.string(),
            ec.message());
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    rs_ensure(!ec, "cannot read directory `{}`: {}", root.string(),
              ec.message());

    const fs::path& entry = it->path();
    const std::string rel = entry.lexically_relative(root).generic_string();
    if (matchSegments(rest, 0, splitSegments(rel), 0)) {
      matches.push_back(entry.lexically_normal());
    }
    if (!recursive && static_cast<std::size_t>(it.depth()) + 1 >= rest.size()) {
      it.disable_recursion_pending();
    }
  }
  rs_ensure(!ec, "cannot read directory `{}`: {}", root.string(),
            ec.message());

  std::ranges::sort(matches);
  const auto dup = std::ranges::unique(matches);
  matches.erase(dup.begin(), dup.end());
  spdlog::trace("glob `{}` in `{}` matched {} path(s)", pattern,
                baseDir.string(), matches.size());
  return rs::Ok(matches);
}

} // namespace weld
