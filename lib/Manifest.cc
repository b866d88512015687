#include "Manifest.hpp"

#include "Dependency.hpp"
#include "TermColor.hpp"

#include <array>
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <toml.hpp>
#include <unordered_set>
#include <utility>
#include <vector>

namespace weld {

using TomlTable = TomlValue::table_type;

// toml11 prefixes every message with `[error] ` and ends it with a newline;
// Diag::error adds both back.
static std::string stripTomlError(std::string what) {
  using std::string_view_literals::operator""sv;

  static constexpr std::string_view errorPrefix = "[error] "sv;
  static constexpr std::string_view colorErrorPrefix =
      "\033[31m\033[01m[error]\033[00m "sv;

  if (what.starts_with(colorErrorPrefix)) {
    what.erase(0, colorErrorPrefix.size());
  } else if (what.starts_with(errorPrefix)) {
    what.erase(0, errorPrefix.size());
  }
  while (!what.empty() && what.back() == '\n') {
    what.pop_back();
  }
  return what;
}

static std::string_view typeName(const TomlValue& val) noexcept {
  if (val.is_table()) {
    return "table";
  } else if (val.is_array()) {
    return "array";
  } else if (val.is_string()) {
    return "string";
  } else if (val.is_boolean()) {
    return "boolean";
  } else if (val.is_integer()) {
    return "integer";
  } else if (val.is_floating()) {
    return "float";
  }
  return "date-time";
}

static std::string keyPath(const std::string_view parent,
                           const std::string_view key) {
  if (parent.empty()) {
    return std::string(key);
  }
  return fmt::format("{}.{}", parent, key);
}

static const TomlValue* findKey(const TomlTable& table,
                                const std::string_view key) noexcept {
  for (const auto& [k, v] : table) {
    if (k == key) {
      return &v;
    }
  }
  return nullptr;
}

static rs::Result<std::string> asString(const TomlValue& val,
                                        const std::string& at) noexcept {
  rs_ensure(val.is_string(), "`{}` must be a string, found {}", at,
            typeName(val));
  return rs::Ok(std::string(val.as_string()));
}

static rs::Result<std::vector<std::string>>
asStringArray(const TomlValue& val, const std::string& at) noexcept {
  rs_ensure(val.is_array(), "`{}` must be an array of strings, found {}", at,
            typeName(val));

  std::vector<std::string> items;
  std::size_t idx = 0;
  for (const TomlValue& item : val.as_array()) {
    items.emplace_back(rs_try(asString(item, fmt::format("{}[{}]", at, idx))));
    ++idx;
  }
  return rs::Ok(std::move(items));
}

static rs::Result<const TomlTable*> asTable(const TomlValue& val,
                                            const std::string& at) noexcept {
  rs_ensure(val.is_table(), "`{}` must be a table, found {}", at,
            typeName(val));
  return rs::Ok(&val.as_table());
}

// Prefixes an error with the key it came from.
template <typename T>
static rs::Result<T> withKeyPath(rs::Result<T> res, const std::string& at) {
  if (res.is_err()) {
    rs_bail("`{}`: {}", at, res.unwrap_err()->what());
  }
  return res;
}

static const std::unordered_set<char> ALLOWED_NAME_CHARS = {
  '-', '_', ':', '.', '/' // allowed in component and template names
};

static rs::Result<void> validateName(const std::string_view what,
                                     const std::string_view name) noexcept {
  rs_ensure(!name.empty(), "{} name must not be empty", what);
  rs_ensure(std::isalnum(static_cast<unsigned char>(name.front())),
            "{} name `{}` must start with an alphanumeric character", what,
            name);
  for (const char c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c))
        && !ALLOWED_NAME_CHARS.contains(c)) {
      rs_bail("{} name `{}` must be alphanumeric, `-`, `_`, `:`, `.`, or `/`",
              what, name);
    }
  }
  return rs::Ok();
}

rs::Result<ComponentType> parseComponentType(const std::string_view str) noexcept {
  if (str == "durable") {
    return rs::Ok(ComponentType::Durable);
  } else if (str == "ephemeral") {
    return rs::Ok(ComponentType::Ephemeral);
  }
  rs_bail("unknown component type `{}` (expected `durable` or `ephemeral`)",
          str);
}

rs::Result<FilePermissions>
parseFilePermissions(const std::string_view str) noexcept {
  if (str == "read-only") {
    return rs::Ok(FilePermissions::ReadOnly);
  } else if (str == "read-write") {
    return rs::Ok(FilePermissions::ReadWrite);
  }
  rs_bail("unknown file permissions `{}` (expected `read-only` or "
          "`read-write`)",
          str);
}

// `rmdirs` entries are removed recursively, so they must stay strictly below
// the command's working directory.
static bool isStrictlyBelow(const std::string& rel) noexcept {
  const fs::path path(rel);
  if (path.is_absolute()) {
    return false;
  }
  const fs::path norm = path.lexically_normal();
  return !norm.empty() && norm != "." && *norm.begin() != "..";
}

static rs::Result<ExternalCommand> parseCommand(const TomlValue& val,
                                                const std::string& at) noexcept {
  const TomlTable& table = *rs_try(asTable(val, at));

  ExternalCommand cmd;
  bool hasCommand = false;
  std::optional<std::vector<std::string>> sources;
  std::optional<std::vector<std::string>> targets;
  for (const auto& [key, item] : table) {
    const std::string itemAt = keyPath(at, key);
    if (key == "command") {
      cmd.command = rs_try(asString(item, itemAt));
      hasCommand = true;
    } else if (key == "dir") {
      cmd.dir = rs_try(asString(item, itemAt));
    } else if (key == "rmdirs") {
      cmd.rmdirs = rs_try(asStringArray(item, itemAt));
    } else if (key == "mkdirs") {
      cmd.mkdirs = rs_try(asStringArray(item, itemAt));
    } else if (key == "sources") {
      sources = rs_try(asStringArray(item, itemAt));
    } else if (key == "targets") {
      targets = rs_try(asStringArray(item, itemAt));
    } else {
      rs_bail("unknown field `{}` in `{}`", key, at);
    }
  }

  rs_ensure(hasCommand, "missing field `command` in `{}`", at);
  rs_ensure(!cmd.command.empty(), "`{}.command` must not be empty", at);
  rs_ensure(sources.has_value() == targets.has_value(),
            "`{}` must specify both `sources` and `targets`, or neither", at);
  for (std::size_t i = 0; i < cmd.rmdirs.size(); ++i) {
    rs_ensure(isStrictlyBelow(cmd.rmdirs[i]),
              "`{}.rmdirs[{}]` must be a relative path below the command's "
              "directory, found `{}`",
              at, i, cmd.rmdirs[i]);
  }
  if (sources.has_value()) {
    cmd.condition = RunIfStale{ .sources = std::move(*sources),
                                .targets = std::move(*targets) };
  }
  return rs::Ok(std::move(cmd));
}

static rs::Result<std::vector<ExternalCommand>>
parseCommands(const TomlValue& val, const std::string& at) noexcept {
  rs_ensure(val.is_array(), "`{}` must be an array of commands, found {}", at,
            typeName(val));

  std::vector<ExternalCommand> cmds;
  std::size_t idx = 0;
  for (const TomlValue& item : val.as_array()) {
    cmds.emplace_back(
        rs_try(parseCommand(item, fmt::format("{}[{}]", at, idx))));
    ++idx;
  }
  return rs::Ok(std::move(cmds));
}

static rs::Result<InitialComponentFile>
parseInitialFile(const TomlValue& val, const std::string& at) noexcept {
  const TomlTable& table = *rs_try(asTable(val, at));

  InitialComponentFile file;
  bool hasSource = false;
  bool hasTarget = false;
  for (const auto& [key, item] : table) {
    const std::string itemAt = keyPath(at, key);
    if (key == "sourcePath") {
      file.sourcePath = rs_try(asString(item, itemAt));
      hasSource = true;
    } else if (key == "targetPath") {
      file.targetPath = rs_try(asString(item, itemAt));
      hasTarget = true;
    } else if (key == "permissions") {
      file.permissions = rs_try(withKeyPath(
          parseFilePermissions(rs_try(asString(item, itemAt))), itemAt));
    } else {
      rs_bail("unknown field `{}` in `{}`", key, at);
    }
  }
  rs_ensure(hasSource, "missing field `sourcePath` in `{}`", at);
  rs_ensure(hasTarget, "missing field `targetPath` in `{}`", at);
  return rs::Ok(std::move(file));
}

static constexpr std::array<std::string_view, 9> PROPERTY_KEYS = {
  "sourceWit",      "generatedWit", "componentWasm",
  "linkedWasm",     "componentType", "build",
  "customCommands", "clean",        "files",
};

static bool isPropertyKey(const std::string_view key) noexcept {
  return std::ranges::find(PROPERTY_KEYS, key) != PROPERTY_KEYS.end();
}

static rs::Result<void> parsePropertyField(ComponentProperties& props,
                                           const std::string& key,
                                           const TomlValue& val,
                                           const std::string& at) noexcept {
  if (key == "sourceWit") {
    props.sourceWit = rs_try(asString(val, at));
  } else if (key == "generatedWit") {
    props.generatedWit = rs_try(asString(val, at));
  } else if (key == "componentWasm") {
    props.componentWasm = rs_try(asString(val, at));
  } else if (key == "linkedWasm") {
    props.linkedWasm = rs_try(asString(val, at));
  } else if (key == "componentType") {
    props.componentType = rs_try(
        withKeyPath(parseComponentType(rs_try(asString(val, at))), at));
  } else if (key == "build") {
    props.build = rs_try(parseCommands(val, at));
  } else if (key == "customCommands") {
    const TomlTable& table = *rs_try(asTable(val, at));
    for (const auto& [name, cmds] : table) {
      rs_try(validateName("custom command", name));
      props.customCommands[name] = rs_try(parseCommands(cmds, keyPath(at, name)));
    }
  } else if (key == "clean") {
    props.clean = rs_try(asStringArray(val, at));
  } else if (key == "files") {
    rs_ensure(val.is_array(), "`{}` must be an array of tables, found {}", at,
              typeName(val));
    std::vector<InitialComponentFile> files;
    std::size_t idx = 0;
    for (const TomlValue& item : val.as_array()) {
      files.emplace_back(
          rs_try(parseInitialFile(item, fmt::format("{}[{}]", at, idx))));
      ++idx;
    }
    props.files = std::move(files);
  }
  return rs::Ok();
}

static rs::Result<ComponentProperties>
parseProperties(const TomlTable& table, const std::string& at,
                const bool allowTemplateKey) noexcept {
  ComponentProperties props;
  for (const auto& [key, val] : table) {
    if (allowTemplateKey && key == "template") {
      continue;
    }
    rs_ensure(isPropertyKey(key), "unknown field `{}` in `{}`", key, at);
    rs_try(parsePropertyField(props, key, val, keyPath(at, key)));
  }
  return rs::Ok(std::move(props));
}

static rs::Result<ComponentProfiles>
parseProfiles(const TomlTable& table, const std::string& at) noexcept {
  ComponentProfiles profiles;
  bool hasProfiles = false;
  bool hasDefault = false;
  for (const auto& [key, val] : table) {
    if (key == "profiles") {
      const std::string profilesAt = keyPath(at, key);
      const TomlTable& entries = *rs_try(asTable(val, profilesAt));
      for (const auto& [name, entry] : entries) {
        rs_try(validateName("profile", name));
        const std::string entryAt = keyPath(profilesAt, name);
        const TomlTable& entryTable = *rs_try(asTable(entry, entryAt));
        profiles.profiles.emplace(
            name, rs_try(parseProperties(entryTable, entryAt,
                                         /*allowTemplateKey=*/false)));
      }
      hasProfiles = true;
    } else if (key == "defaultProfile") {
      profiles.defaultProfile = rs_try(asString(val, keyPath(at, key)));
      hasDefault = true;
    }
  }

  rs_ensure(hasProfiles, "missing field `profiles` in `{}`", at);
  rs_ensure(hasDefault, "missing field `defaultProfile` in `{}`", at);
  rs_ensure(!profiles.profiles.empty(), "`{}.profiles` must not be empty", at);
  rs_ensure(profiles.profiles.contains(profiles.defaultProfile),
            "`{}.defaultProfile` names `{}`, which is not one of its profiles",
            at, profiles.defaultProfile);
  return rs::Ok(std::move(profiles));
}

namespace {

// Which of the mutually exclusive field groups a template or component
// table uses.
struct Shape {
  bool templateRef = false;
  bool profiles = false;
  bool properties = false;

  std::size_t count() const noexcept {
    return static_cast<std::size_t>(templateRef)
           + static_cast<std::size_t>(profiles)
           + static_cast<std::size_t>(properties);
  }

  std::string describe() const {
    std::vector<std::string_view> names;
    if (templateRef) {
      names.emplace_back("template reference");
    }
    if (profiles) {
      names.emplace_back("profiles");
    }
    if (properties) {
      names.emplace_back("properties");
    }
    return fmt::format("{}", fmt::join(names, " and "));
  }
};

} // namespace

static rs::Result<Shape> scanShape(const TomlTable& table,
                                   const std::string& at) noexcept {
  Shape shape;
  for (const auto& [key, val] : table) {
    if (key == "template") {
      shape.templateRef = true;
    } else if (key == "profiles" || key == "defaultProfile") {
      shape.profiles = true;
    } else if (isPropertyKey(key)) {
      shape.properties = true;
    } else {
      rs_bail("unknown field `{}` in `{}`", key, at);
    }
  }
  return rs::Ok(shape);
}

static rs::Result<ComponentTemplate>
parseTemplate(const TomlValue& val, const std::string& at) noexcept {
  const TomlTable& table = *rs_try(asTable(val, at));
  const Shape shape = rs_try(scanShape(table, at));
  rs_ensure(shape.count() <= 1, "ambiguous shape for `{}`: found {} fields", at,
            shape.describe());

  if (shape.templateRef) {
    const std::string name =
        rs_try(asString(*findKey(table, "template"), keyPath(at, "template")));
    ComponentTemplate tmpl = TemplateRef{ .name = name };
    return rs::Ok(std::move(tmpl));
  } else if (shape.profiles) {
    ComponentTemplate tmpl = rs_try(parseProfiles(table, at));
    return rs::Ok(std::move(tmpl));
  }
  ComponentTemplate tmpl =
      rs_try(parseProperties(table, at, /*allowTemplateKey=*/false));
  return rs::Ok(std::move(tmpl));
}

// A component may name a template beside its own properties or profiles;
// properties and profiles exclude each other.
static rs::Result<ComponentDefinition>
parseComponent(const std::string& name, const TomlValue& val,
               const std::string& at) noexcept {
  rs_try(validateName("component", name));
  const TomlTable& table = *rs_try(asTable(val, at));
  const Shape shape = rs_try(scanShape(table, at));
  rs_ensure(!(shape.profiles && shape.properties),
            "ambiguous shape for `{}`: found profiles and properties fields",
            at);

  ComponentDefinition def;
  def.name = name;
  if (shape.templateRef) {
    def.templateName =
        rs_try(asString(*findKey(table, "template"), keyPath(at, "template")));
  }
  if (shape.profiles) {
    def.body = rs_try(parseProfiles(table, at));
  } else {
    def.body = rs_try(parseProperties(table, at, /*allowTemplateKey=*/true));
  }
  return rs::Ok(std::move(def));
}

static rs::Result<ComponentDependency>
parseDependency(const TomlValue& val, const std::string& at) noexcept {
  const TomlTable& table = *rs_try(asTable(val, at));

  std::optional<DependencyType> type;
  std::optional<std::string> target;
  for (const auto& [key, item] : table) {
    const std::string itemAt = keyPath(at, key);
    if (key == "type") {
      type = rs_try(withKeyPath(
          parseDependencyType(rs_try(asString(item, itemAt))), itemAt));
    } else if (key == "target") {
      target = rs_try(asString(item, itemAt));
    } else {
      rs_bail("unknown field `{}` in `{}`", key, at);
    }
  }
  rs_ensure(type.has_value(), "missing field `type` in `{}`", at);
  rs_ensure(target.has_value(), "missing field `target` in `{}`", at);
  return rs::Ok(ComponentDependency(*type, std::move(*target)));
}

static rs::Result<std::vector<ComponentDependency>>
parseDependencyList(const TomlValue& val, const std::string& at) noexcept {
  rs_ensure(val.is_array(), "`{}` must be an array of tables, found {}", at,
            typeName(val));

  std::vector<ComponentDependency> deps;
  std::size_t idx = 0;
  for (const TomlValue& item : val.as_array()) {
    deps.emplace_back(
        rs_try(parseDependency(item, fmt::format("{}[{}]", at, idx))));
    ++idx;
  }
  return rs::Ok(std::move(deps));
}

fs::path Manifest::baseDir() const {
  const fs::path parent = path.parent_path();
  if (parent.empty()) {
    return ".";
  }
  return parent;
}

fs::path Manifest::tempDirPath() const {
  return baseDir() / tempDir.value_or(DEFAULT_TEMP_DIR);
}

const ComponentDefinition*
Manifest::findComponent(const std::string_view name) const {
  const auto itr = std::ranges::find_if(
      components,
      [name](const ComponentDefinition& comp) { return comp.name == name; });
  if (itr == components.end()) {
    return nullptr;
  }
  return &*itr;
}

rs::Result<Manifest> Manifest::tryParse(const fs::path& path) noexcept {
  rs_ensure(fs::exists(path), "{} not found at `{}`", FILE_NAME,
            path.string());

  if (shouldColorStderr()) {
    toml::color::enable();
  } else {
    toml::color::disable();
  }

  TomlValue data;
  try {
    data = toml::parse<toml::ordered_type_config>(path);
  } catch (const std::exception& e) {
    rs_bail("failed to parse `{}`: {}", path.string(),
            stripTomlError(e.what()));
  }
  spdlog::debug("Parsed manifest: {}", path.string());
  return tryFromToml(data, path);
}

rs::Result<Manifest> Manifest::tryFromToml(const TomlValue& data,
                                           fs::path path) noexcept {
  rs_ensure(data.is_table(), "manifest root must be a table, found {}",
            typeName(data));

  Manifest manifest;
  manifest.path = std::move(path);
  for (const auto& [key, val] : data.as_table()) {
    if (key == "includes") {
      manifest.includes = rs_try(asStringArray(val, key));
    } else if (key == "tempDir") {
      manifest.tempDir = rs_try(asString(val, key));
    } else if (key == "witDeps") {
      manifest.witDeps = rs_try(asStringArray(val, key));
    } else if (key == "templates") {
      const TomlTable& table = *rs_try(asTable(val, key));
      for (const auto& [name, tmpl] : table) {
        rs_try(validateName("template", name));
        manifest.templates.emplace(
            name, rs_try(parseTemplate(tmpl, keyPath(key, name))));
      }
    } else if (key == "components") {
      const TomlTable& table = *rs_try(asTable(val, key));
      for (const auto& [name, comp] : table) {
        manifest.components.emplace_back(
            rs_try(parseComponent(name, comp, keyPath(key, name))));
      }
    } else if (key == "dependencies") {
      const TomlTable& table = *rs_try(asTable(val, key));
      for (const auto& [name, deps] : table) {
        manifest.dependencies.emplace(
            name, rs_try(parseDependencyList(deps, keyPath(key, name))));
      }
    } else {
      rs_bail("unknown field `{}` in manifest root", key);
    }
  }

  spdlog::debug("Manifest declares {} template(s), {} component(s)",
                manifest.templates.size(), manifest.components.size());
  return rs::Ok(std::move(manifest));
}

} // namespace weld
