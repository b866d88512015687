#include "helpers.hpp"

#include <boost/ut.hpp>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace {

const std::string MANIFEST = R"(
[templates.sh]
defaultProfile = "debug"

[templates.sh.profiles.debug]
build = [{ command = 'echo debug > out.txt', sources = ["src"], targets = ["out.txt"] }]

[templates.sh.profiles.release]
build = [{ command = 'echo release > out.txt' }]

[components.api]
template = "sh"

[components.api.customCommands]
fmt = [{ command = 'touch formatted' }]

[components.worker]
build = [{ command = 'touch worker.wasm' }]

[dependencies]
api = [{ type = "wasm-rpc", target = "worker" }]
)";

} // namespace

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "weld --version"_test = [] {
    const auto result = tests::runWeld({ "--version" }).unwrap();
    expect(result.status.success());
    expect(result.out.starts_with("weld "));
  };

  "weld with an unknown command fails"_test = [] {
    const auto result = tests::runWeld({ "frobnicate" }).unwrap();
    expect(!result.status.success());
    expect(result.err.find("no such command: `frobnicate`")
           != std::string::npos);
  };

  "weld build without a manifest fails"_test = [] {
    const tests::TempDir tmp;
    const auto result = tests::runWeld({ "build" }, tmp.path).unwrap();
    expect(!result.status.success());
    expect(result.err.starts_with("Error: "));
  };

  "weld list"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "weld.toml", MANIFEST);

    const auto result = tests::runWeld({ "list" }, tmp.path).unwrap();
    expect(result.status.success()) << result.err;
    expect(result.out
           == "api [debug]\n"
              "  build steps: 1\n"
              "  depends on: worker (wasm-rpc)\n"
              "  custom commands: fmt\n"
              "worker\n"
              "  build steps: 1\n")
        << result.out;

    const auto release =
        tests::runWeld({ "list", "--profile", "release" }, tmp.path).unwrap();
    expect(release.out.starts_with("api [release]\n"));

    const auto missing =
        tests::runWeld({ "list", "-p", "prod" }, tmp.path).unwrap();
    expect(!missing.status.success());
    expect(missing.err.find("component `api` has no profile `prod`")
           != std::string::npos);
  };

  "weld build runs steps and writes a report"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "app/weld.toml", R"(
      [components.worker]
      build = [{ command = 'touch worker.wasm' }]

      [components.api]
      build = [{ command = 'echo built > api.wasm' }]

      [dependencies]
      api = [{ type = "wasm", target = "worker" }]
    )");

    const auto result =
        tests::runWeld({ "build", "-C", "app", "-j", "2", "--report",
                         "report.json" },
                       tmp.path)
            .unwrap();
    expect(result.status.success()) << result.err;
    expect(std::filesystem::exists(tmp / "app/worker.wasm"));
    expect(tests::readFile(tmp / "app/api.wasm") == "built\n");
    expect(result.err.find("Finished `build` for 2 components in <DURATION>s")
           != std::string::npos)
        << result.err;

    const auto report =
        nlohmann::json::parse(tests::readFile(tmp / "report.json"));
    expect(report["success"] == true);
    expect(report["components"][0]["name"] == "worker");
    expect(report["components"][1]["name"] == "api");
  };

  "weld build exits non-zero when a step fails"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "weld.toml", R"(
      [components.broken]
      build = [{ command = 'exit 4' }]
    )");

    const auto result =
        tests::runWeld({ "build", "--report", "report.json" }, tmp.path)
            .unwrap();
    expect(!result.status.success());
    expect(result.err.find("`build` failed") != std::string::npos);
    // The report is still written.
    const auto report =
        nlohmann::json::parse(tests::readFile(tmp / "report.json"));
    expect(report["components"][0]["steps"][0]["exitCode"] == 4);
  };

  "weld -v echoes the output of successful steps"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "weld.toml", R"(
      [components.api]
      build = [{ command = 'echo step-output-$((40 + 2))' }]
    )");

    const auto quiet = tests::runWeld({ "build" }, tmp.path).unwrap();
    expect(quiet.status.success()) << quiet.err;
    expect(quiet.err.find("step-output-42") == std::string::npos);

    const auto verbose = tests::runWeld({ "build", "-v" }, tmp.path).unwrap();
    expect(verbose.status.success()) << verbose.err;
    expect(verbose.err.find("step-output-42") != std::string::npos)
        << verbose.err;
  };

  "weld build rejects a bad job count"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "weld.toml", MANIFEST);
    const auto result = tests::runWeld({ "build", "-j", "0" }, tmp.path).unwrap();
    expect(!result.status.success());
    expect(result.err.find("invalid number of jobs: 0") != std::string::npos);
  };

  "weld exec and clean"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "weld.toml", R"(
      tempDir = "tmp"

      [components.api]
      componentWasm = "api.wasm"

      [components.api.customCommands]
      fmt = [{ command = 'touch formatted' }]
    )");
    tests::writeFile(tmp / "api.wasm", "");
    tests::writeFile(tmp / "tmp/cache", "");

    const auto exec = tests::runWeld({ "exec", "fmt" }, tmp.path).unwrap();
    expect(exec.status.success()) << exec.err;
    expect(std::filesystem::exists(tmp / "formatted"));

    const auto noName = tests::runWeld({ "exec" }, tmp.path).unwrap();
    expect(!noName.status.success());

    const auto clean = tests::runWeld({ "clean" }, tmp.path).unwrap();
    expect(clean.status.success()) << clean.err;
    expect(!std::filesystem::exists(tmp / "api.wasm"));
    expect(!std::filesystem::exists(tmp / "tmp"));
  };
}
