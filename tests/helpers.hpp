#pragma once

#include "Command.hpp"
#include "Manifest.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <random>
#include <regex>
#include <rs/result.hpp>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <toml.hpp>
#include <utility>
#include <vector>

namespace tests {

namespace fs = std::filesystem;

inline fs::path weldBinary() {
  if (const char* env = std::getenv("WELD")) {
    return fs::path(env);
  }
  return fs::current_path() / "weld";
}

struct RunResult {
  weld::ExitStatus status;
  std::string out;
  std::string err;
};

inline std::string scrubDurations(std::string text) {
  static const std::regex pattern(R"(in [0-9]+\.[0-9]+s)");
  return std::regex_replace(text, pattern, "in <DURATION>s");
}

inline rs::Result<RunResult> runWeld(const std::vector<std::string>& args,
                                     const fs::path& workdir = {}) {
  weld::Command cmd(weldBinary().string());
  cmd.setEnv("WELD_TERM_COLOR", "never");
  cmd.addArgs(args);
  if (!workdir.empty()) {
    cmd.setWorkingDirectory(workdir);
  }
  cmd.setStdOutConfig(weld::Command::IOConfig::Piped);
  cmd.setStdErrConfig(weld::Command::IOConfig::Piped);

  const weld::CommandOutput output = rs_try(cmd.output());
  return rs::Ok(RunResult{ output.exitStatus, output.stdOut,
                           scrubDurations(output.stdErr) });
}

inline rs::Result<RunResult> runWeld(std::initializer_list<std::string> args,
                                     const fs::path& workdir = {}) {
  return runWeld(std::vector<std::string>(args), workdir);
}

struct TempDir {
  fs::path path;

  TempDir()
      : path([] {
          const auto epoch =
              std::chrono::steady_clock::now().time_since_epoch();
          const auto ticks =
              std::chrono::duration_cast<std::chrono::nanoseconds>(epoch)
                  .count();
          const auto random =
              static_cast<std::uint64_t>(std::random_device{}());
          std::ostringstream oss;
          oss << "weld-test-" << random << '-' << ticks;
          return fs::temp_directory_path() / oss.str();
        }()) {
    fs::create_directories(path);
  }

  ~TempDir() {
    if (path.empty()) {
      return;
    }
    std::error_code ec;
    fs::remove_all(path, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  TempDir(TempDir&& other) noexcept : path(std::move(other.path)) {
    other.path.clear();
  }

  TempDir& operator=(TempDir&& other) noexcept {
    if (this != &other) {
      path = std::move(other.path);
      other.path.clear();
    }
    return *this;
  }

  [[nodiscard]] fs::path operator/(const fs::path& relative) const {
    return path / relative;
  }
};

inline std::string readFile(const fs::path& file) {
  std::ifstream ifs(file);
  return std::string(std::istreambuf_iterator<char>(ifs), {});
}

// Creates parent directories as needed.
inline void writeFile(const fs::path& file, const std::string& content) {
  if (file.has_parent_path()) {
    fs::create_directories(file.parent_path());
  }
  std::ofstream ofs(file);
  ofs << content;
}

// Sets `file`'s mtime to a fixed offset from now, so ordering does not
// depend on filesystem timestamp resolution.
inline void setMtime(const fs::path& file, const std::chrono::seconds offset) {
  fs::last_write_time(file, fs::file_time_type::clock::now() + offset);
}

inline weld::Manifest parseManifest(const std::string& content,
                                    const fs::path& path = "weld.toml") {
  const weld::TomlValue data =
      toml::parse_str<toml::ordered_type_config>(content);
  return weld::Manifest::tryFromToml(data, path).unwrap();
}

inline std::string manifestError(const std::string& content) {
  const weld::TomlValue data =
      toml::parse_str<toml::ordered_type_config>(content);
  return weld::Manifest::tryFromToml(data, "weld.toml").unwrap_err()->what();
}

} // namespace tests
