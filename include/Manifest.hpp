#pragma once

#include "Dependency.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <toml.hpp>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace weld {

namespace fs = std::filesystem;

using TomlValue = toml::ordered_value;

struct RunAlways {
  bool operator==(const RunAlways&) const = default;
};

// Runs only when a target is missing or older than the newest source.
struct RunIfStale {
  std::vector<std::string> sources;
  std::vector<std::string> targets;

  bool operator==(const RunIfStale&) const = default;
};

using RunCondition = std::variant<RunAlways, RunIfStale>;

struct ExternalCommand {
  std::string command;
  // Relative to the manifest directory; unset means the manifest directory.
  std::optional<std::string> dir;
  // Relative to the working directory.  rmdirs are removed before mkdirs
  // are created.
  std::vector<std::string> rmdirs;
  std::vector<std::string> mkdirs;
  RunCondition condition;

  static ExternalCommand always(std::string command) {
    ExternalCommand cmd;
    cmd.command = std::move(command);
    return cmd;
  }
  static ExternalCommand ifStale(std::string command,
                                 std::vector<std::string> sources,
                                 std::vector<std::string> targets) {
    ExternalCommand cmd;
    cmd.command = std::move(command);
    cmd.condition = RunIfStale{ .sources = std::move(sources),
                                .targets = std::move(targets) };
    return cmd;
  }

  bool isIncremental() const noexcept {
    return std::holds_alternative<RunIfStale>(condition);
  }

  bool operator==(const ExternalCommand&) const = default;
};

enum class ComponentType : std::uint8_t {
  Durable,
  Ephemeral,
};

enum class FilePermissions : std::uint8_t {
  ReadOnly,
  ReadWrite,
};

// A file seeded into the component's runtime filesystem.  weld only carries
// these through resolution; provisioning happens elsewhere.
struct InitialComponentFile {
  std::string sourcePath;
  std::string targetPath;
  FilePermissions permissions = FilePermissions::ReadOnly;

  bool operator==(const InitialComponentFile&) const = default;
};

// Every field is optional so that "unset" (inherit from the template) and
// "set to empty" (override with nothing) stay distinct.
struct ComponentProperties {
  std::optional<std::string> sourceWit;
  std::optional<std::string> generatedWit;
  std::optional<std::string> componentWasm;
  std::optional<std::string> linkedWasm;
  std::optional<ComponentType> componentType;
  std::optional<std::vector<ExternalCommand>> build;
  std::map<std::string, std::vector<ExternalCommand>> customCommands;
  std::optional<std::vector<std::string>> clean;
  std::optional<std::vector<InitialComponentFile>> files;

  bool operator==(const ComponentProperties&) const = default;
};

struct ComponentProfiles {
  std::map<std::string, ComponentProperties> profiles;
  std::string defaultProfile;

  bool operator==(const ComponentProfiles&) const = default;
};

struct TemplateRef {
  std::string name;

  bool operator==(const TemplateRef&) const = default;
};

using ComponentTemplate =
    std::variant<TemplateRef, ComponentProperties, ComponentProfiles>;

using ComponentBody = std::variant<ComponentProperties, ComponentProfiles>;

struct ComponentDefinition {
  std::string name;
  std::optional<std::string> templateName;
  ComponentBody body;
};

struct Manifest {
  static constexpr const char* FILE_NAME = "weld.toml";
  static constexpr const char* DEFAULT_TEMP_DIR = "golem-temp";

  fs::path path;
  std::vector<std::string> includes;
  std::optional<std::string> tempDir;
  std::vector<std::string> witDeps;
  std::unordered_map<std::string, ComponentTemplate> templates;
  // Declaration order is kept; it breaks ties in the build order.
  std::vector<ComponentDefinition> components;
  std::unordered_map<std::string, std::vector<ComponentDependency>>
      dependencies;

  // Directory every relative path in the manifest is resolved against.
  fs::path baseDir() const;
  fs::path tempDirPath() const;
  const ComponentDefinition* findComponent(std::string_view name) const;

  static rs::Result<Manifest> tryParse(const fs::path& path) noexcept;
  static rs::Result<Manifest> tryFromToml(const TomlValue& data,
                                          fs::path path) noexcept;
};

rs::Result<ComponentType> parseComponentType(std::string_view str) noexcept;
rs::Result<FilePermissions> parseFilePermissions(std::string_view str) noexcept;

} // namespace weld
