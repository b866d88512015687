#include "helpers.hpp"

#include "Dependency.hpp"
#include "Manifest.hpp"

#include <boost/ut.hpp>
#include <string>
#include <variant>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "manifest loads templates, components and dependencies"_test = [] {
    const weld::Manifest manifest = tests::parseManifest(R"(
      tempDir = "target/tmp"
      witDeps = ["wit/deps"]

      [templates.rust]
      defaultProfile = "debug"

      [templates.rust.profiles.debug]
      componentWasm = "target/debug/{{ component }}.wasm"
      build = [
        { command = "cargo component build", sources = ["src"], targets = ["target/debug"] },
      ]

      [templates.rust.profiles.release]
      componentWasm = "target/release/{{ component }}.wasm"

      [templates.alias]
      template = "rust"

      [components.zeta]
      template = "rust"

      [components.alpha]
      sourceWit = "wit"
      build = [{ command = "make", dir = "alpha", rmdirs = ["out"], mkdirs = ["out"] }]

      [dependencies]
      zeta = [{ type = "wasm-rpc", target = "alpha" }]
    )",
                                                      "/work/app/weld.toml");

    expect(manifest.tempDir == "target/tmp");
    expect(manifest.witDeps == std::vector<std::string>{ "wit/deps" });
    expect(manifest.templates.size() == 2U);
    expect(std::holds_alternative<weld::TemplateRef>(
        manifest.templates.at("alias")));

    const auto& rust =
        std::get<weld::ComponentProfiles>(manifest.templates.at("rust"));
    expect(rust.defaultProfile == "debug");
    expect(rust.profiles.size() == 2U);
    const auto& debugBuild = rust.profiles.at("debug").build.value();
    expect(debugBuild.size() == 1U);
    expect(debugBuild[0]
           == weld::ExternalCommand::ifStale("cargo component build", { "src" },
                                             { "target/debug" }));

    // Declaration order, not alphabetical.
    expect(manifest.components.size() == 2U);
    expect(manifest.components[0].name == "zeta");
    expect(manifest.components[1].name == "alpha");

    const weld::ComponentDefinition& zeta = manifest.components[0];
    expect(zeta.templateName == "rust");
    expect(std::get<weld::ComponentProperties>(zeta.body)
           == weld::ComponentProperties{});

    const auto& alpha =
        std::get<weld::ComponentProperties>(manifest.components[1].body);
    expect(alpha.sourceWit == "wit");
    const weld::ExternalCommand& make = alpha.build.value().at(0);
    expect(make.dir == "alpha");
    expect(make.rmdirs == std::vector<std::string>{ "out" });
    expect(make.mkdirs == std::vector<std::string>{ "out" });
    expect(!make.isIncremental());

    expect(manifest.dependencies.at("zeta")
           == std::vector{ weld::ComponentDependency::wasmRpc("alpha") });

    expect(manifest.baseDir() == "/work/app");
    expect(manifest.tempDirPath() == "/work/app/target/tmp");
    expect(manifest.findComponent("alpha") == &manifest.components[1]);
    expect(manifest.findComponent("missing") == nullptr);
  };

  "manifest defaults"_test = [] {
    const weld::Manifest manifest = tests::parseManifest("");
    expect(!manifest.tempDir.has_value());
    expect(manifest.tempDirPath() == "./golem-temp");
    expect(manifest.components.empty());
  };

  "manifest parses supplementary properties"_test = [] {
    const weld::Manifest manifest = tests::parseManifest(R"(
      [components.store]
      componentType = "ephemeral"
      clean = ["dist"]
      files = [
        { sourcePath = "seed/config.json", targetPath = "/etc/config.json" },
        { sourcePath = "seed/data", targetPath = "/data", permissions = "read-write" },
      ]

      [components.store.customCommands]
      fmt = [{ command = "cargo fmt" }]

      [dependencies]
      store = [
        { type = "static-wasm-rpc", target = "store" },
        { type = "wasm", target = "store" },
      ]
    )");

    const auto& props =
        std::get<weld::ComponentProperties>(manifest.components[0].body);
    expect(props.componentType == weld::ComponentType::Ephemeral);
    expect(props.clean == std::vector<std::string>{ "dist" });
    expect(props.files.value().size() == 2U);
    expect(props.files.value()[0].permissions
           == weld::FilePermissions::ReadOnly);
    expect(props.files.value()[1].permissions
           == weld::FilePermissions::ReadWrite);
    expect(props.customCommands.at("fmt").at(0).command == "cargo fmt");

    const auto& deps = manifest.dependencies.at("store");
    expect(deps[0].type == weld::DependencyType::StaticWasmRpc);
    expect(deps[1].type == weld::DependencyType::Wasm);
  };

  "manifest distinguishes empty from unset"_test = [] {
    const weld::Manifest manifest = tests::parseManifest(R"(
      [components.a]
      build = []
    )");
    const auto& props =
        std::get<weld::ComponentProperties>(manifest.components[0].body);
    expect(props.build.has_value());
    expect(props.build->empty());
    expect(!props.clean.has_value());
  };

  "manifest rejects unknown keys"_test = [] {
    expect(tests::manifestError("name = \"app\"")
           == "unknown field `name` in manifest root");
    expect(tests::manifestError(R"(
      [components.api]
      build = [{ command = "make", shell = "bash" }]
    )") == "unknown field `shell` in `components.api.build[0]`");
    expect(tests::manifestError(R"(
      [templates.t]
      sourcewit = "wit"
    )") == "unknown field `sourcewit` in `templates.t`");
  };

  "manifest names the key path of a wrong type"_test = [] {
    expect(tests::manifestError("tempDir = 3")
           == "`tempDir` must be a string, found integer");
    expect(tests::manifestError(R"(
      [components.api]
      build = [{ command = "make" }, "make install"]
    )") == "`components.api.build[1]` must be a table, found string");
    expect(tests::manifestError(R"(
      [components.api]
      clean = ["out", 1]
    )") == "`components.api.clean[1]` must be a string, found integer");
  };

  "manifest requires sources and targets together"_test = [] {
    expect(tests::manifestError(R"(
      [components.api]
      build = [{ command = "make", sources = ["src"] }]
    )")
           == "`components.api.build[0]` must specify both `sources` and "
              "`targets`, or neither");
    expect(tests::manifestError(R"(
      [components.api]
      build = [{ dir = "x" }]
    )") == "missing field `command` in `components.api.build[0]`");
  };

  "manifest keeps rmdirs below the command directory"_test = [] {
    for (const char* dir : { ".", "", "..", "out/../..", "./", "/tmp/out" }) {
      const std::string err = tests::manifestError(
          "[components.api]\nbuild = [{ command = \"make\", rmdirs = [\"out\", \""
          + std::string(dir) + "\"] }]\n");
      expect(err
             == "`components.api.build[0].rmdirs[1]` must be a relative path "
                "below the command's directory, found `"
                    + std::string(dir) + "`")
          << err;
    }

    const weld::Manifest manifest = tests::parseManifest(R"(
      [components.api]
      build = [{ command = "make", rmdirs = ["out", "./gen", "a/../b"] }]
    )");
    const auto& props =
        std::get<weld::ComponentProperties>(manifest.components[0].body);
    expect(props.build.value()[0].rmdirs.size() == 3U);
  };

  "manifest rejects ambiguous shapes"_test = [] {
    expect(tests::manifestError(R"(
      [templates.t]
      template = "base"
      sourceWit = "wit"
    )")
           == "ambiguous shape for `templates.t`: found template reference "
              "and properties fields");
    expect(tests::manifestError(R"(
      [components.api]
      sourceWit = "wit"
      defaultProfile = "debug"
      profiles = { debug = {} }
    )")
           == "ambiguous shape for `components.api`: found profiles and "
              "properties fields");
  };

  "manifest checks profiles"_test = [] {
    expect(tests::manifestError(R"(
      [templates.t]
      defaultProfile = "release"
      profiles = { debug = {} }
    )")
           == "`templates.t.defaultProfile` names `release`, which is not one "
              "of its profiles");
    expect(tests::manifestError(R"(
      [templates.t]
      profiles = { debug = {} }
    )") == "missing field `defaultProfile` in `templates.t`");
  };

  "manifest checks dependencies"_test = [] {
    expect(tests::manifestError(R"(
      [dependencies]
      api = [{ type = "grpc", target = "db" }]
    )")
           == "`dependencies.api[0].type`: unknown dependency type `grpc` "
              "(expected `wasm-rpc`, `static-wasm-rpc`, or `wasm`)");
    expect(tests::manifestError(R"(
      [dependencies]
      api = [{ type = "wasm-rpc" }]
    )") == "missing field `target` in `dependencies.api[0]`");
  };

  "manifest checks enumerations"_test = [] {
    expect(tests::manifestError(R"(
      [components.api]
      componentType = "forever"
    )")
           == "`components.api.componentType`: unknown component type "
              "`forever` (expected `durable` or `ephemeral`)");
    expect(tests::manifestError(R"(
      [components.api]
      files = [{ sourcePath = "a", targetPath = "/a", permissions = "rwx" }]
    )")
           == "`components.api.files[0].permissions`: unknown file "
              "permissions `rwx` (expected `read-only` or `read-write`)");
  };

  "manifest tryParse reports missing and malformed files"_test = [] {
    const tests::TempDir tmp;
    const auto missing = weld::Manifest::tryParse(tmp / "weld.toml");
    expect(missing.is_err());

    tests::writeFile(tmp / "weld.toml", "[components\n");
    const auto malformed = weld::Manifest::tryParse(tmp / "weld.toml");
    expect(malformed.is_err());
    expect(std::string(malformed.unwrap_err()->what())
               .starts_with("failed to parse"));

    tests::writeFile(tmp / "weld.toml", "[components.api]\nsourceWit = \"wit\"\n");
    const auto ok = weld::Manifest::tryParse(tmp / "weld.toml");
    expect(ok.is_ok());
    expect(ok.unwrap().baseDir() == tmp.path);
  };

  "dependency type names"_test = [] {
    expect(weld::toString(weld::DependencyType::WasmRpc) == "wasm-rpc");
    expect(weld::parseDependencyType("wasm").unwrap()
           == weld::DependencyType::Wasm);
    expect(!weld::needsTargetBinary(weld::DependencyType::StaticWasmRpc));
    expect(weld::needsTargetBinary(weld::DependencyType::Wasm));
  };
}
