#include "Builder/Staleness.hpp"

#include "Algos.hpp"
#include "Glob.hpp"

#include <algorithm>
#include <filesystem>
#include <fmt/format.h>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace weld {

namespace {

struct MtimeRange {
  fs::file_time_type oldest = fs::file_time_type::max();
  fs::path oldestPath;
  fs::file_time_type newest = fs::file_time_type::min();
  fs::path newestPath;

  void add(const fs::path& path, const fs::file_time_type mtime) {
    if (mtime < oldest) {
      oldest = mtime;
      oldestPath = path;
    }
    if (mtime > newest) {
      newest = mtime;
      newestPath = path;
    }
  }
};

} // namespace

static rs::Result<void> addMtimes(MtimeRange& range, const fs::path& path) {
  std::error_code ec;
  const fs::file_time_type mtime = fs::last_write_time(path, ec);
  rs_ensure(!ec, "cannot stat `{}`: {}", path.string(), ec.message());
  range.add(path, mtime);

  if (!fs::is_directory(path, ec)) {
    return rs::Ok();
  }
  fs::recursive_directory_iterator it(
      path, fs::directory_options::skip_permission_denied, ec);
  rs_ensure(!ec, "cannot read directory `{}`: {}", path.string(),
            ec.message());
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    rs_ensure(!ec, "cannot read directory `{}`: {}", path.string(),
              ec.message());
    const fs::file_time_type entryMtime = it->last_write_time(ec);
    rs_ensure(!ec, "cannot stat `{}`: {}", it->path().string(), ec.message());
    range.add(it->path(), entryMtime);
  }
  rs_ensure(!ec, "cannot read directory `{}`: {}", path.string(),
            ec.message());
  return rs::Ok();
}

// Expands every pattern; returns the first pattern that matched nothing, if
// any, instead of a range.
static rs::Result<std::variant<MtimeRange, std::string>>
collectMtimes(const std::vector<std::string>& patterns,
              const fs::path& workDir) {
  MtimeRange range;
  for (const std::string& pattern : patterns) {
    const std::vector<fs::path> matches = rs_try(expandGlob(workDir, pattern));
    if (matches.empty()) {
      return rs::Ok(std::variant<MtimeRange, std::string>(pattern));
    }
    for (const fs::path& match : matches) {
      rs_try(addMtimes(range, match));
    }
  }
  return rs::Ok(std::variant<MtimeRange, std::string>(std::move(range)));
}

static std::string displayPath(const fs::path& path, const fs::path& workDir) {
  const fs::path rel = path.lexically_relative(workDir);
  if (rel.empty() || rel.native().starts_with("..")) {
    return path.string();
  }
  return rel.string();
}

static rs::Result<StalenessVerdict>
evaluateIncremental(const RunIfStale& cond, const fs::path& workDir) {
  const auto sources = rs_try(collectMtimes(cond.sources, workDir));
  if (const auto* missing = std::get_if<std::string>(&sources)) {
    rs_bail("source pattern `{}` matched nothing in `{}`", *missing,
            workDir.string());
  }

  if (cond.targets.empty()) {
    return rs::Ok(StalenessVerdict{ .freshness = Freshness::Stale,
                                    .reason = "no targets declared" });
  }
  const auto targets = rs_try(collectMtimes(cond.targets, workDir));
  if (const auto* missing = std::get_if<std::string>(&targets)) {
    return rs::Ok(StalenessVerdict{
        .freshness = Freshness::Stale,
        .reason = fmt::format("target `{}` does not exist", *missing) });
  }

  const MtimeRange& src = std::get<MtimeRange>(sources);
  const MtimeRange& tgt = std::get<MtimeRange>(targets);
  if (cond.sources.empty()) {
    return rs::Ok(StalenessVerdict{ .freshness = Freshness::Fresh,
                                    .reason = "no sources declared" });
  }
  if (src.newest > tgt.oldest) {
    return rs::Ok(StalenessVerdict{
        .freshness = Freshness::Stale,
        .reason = fmt::format("`{}` is newer than `{}`",
                              displayPath(src.newestPath, workDir),
                              displayPath(tgt.oldestPath, workDir)) });
  }
  return rs::Ok(StalenessVerdict{ .freshness = Freshness::Fresh,
                                  .reason = "targets are up to date" });
}

rs::Result<StalenessVerdict> evaluateStaleness(const ExternalCommand& cmd,
                                               const fs::path& workDir) noexcept {
  try {
    StalenessVerdict verdict = rs_try(std::visit(
        Overloaded{
            [](const RunAlways&) -> rs::Result<StalenessVerdict> {
              return rs::Ok(
                  StalenessVerdict{ .freshness = Freshness::Stale,
                                    .reason = "command always runs" });
            },
            [&](const RunIfStale& cond) -> rs::Result<StalenessVerdict> {
              return evaluateIncremental(cond, workDir);
            },
        },
        cmd.condition));
    spdlog::debug("`{}`: {} ({})", cmd.command,
                  verdict.isStale() ? "stale" : "fresh", verdict.reason);
    return rs::Ok(std::move(verdict));
  } catch (const fs::filesystem_error& e) {
    rs_bail("{}", e.what());
  }
}

} // namespace weld
