#include "helpers.hpp"

#include "Builder/Staleness.hpp"
#include "Manifest.hpp"

#include <boost/ut.hpp>
#include <chrono>
#include <string>

namespace {

weld::StalenessVerdict verdictOf(const weld::ExternalCommand& cmd,
                                 const tests::TempDir& dir) {
  return weld::evaluateStaleness(cmd, dir.path).unwrap();
}

} // namespace

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;
  using namespace std::chrono_literals;

  "commands without sources and targets always run"_test = [] {
    const tests::TempDir tmp;
    const auto verdict = verdictOf(weld::ExternalCommand::always("make"), tmp);
    expect(verdict.isStale());
    expect(verdict.reason == "command always runs");
  };

  "targets older than a source are stale"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "src/main.rs", "fn main() {}");
    tests::writeFile(tmp / "out/app.wasm", "");
    tests::setMtime(tmp / "out/app.wasm", -60s);
    tests::setMtime(tmp / "src/main.rs", -10s);

    const auto verdict = verdictOf(
        weld::ExternalCommand::ifStale("build", { "src/*.rs" },
                                       { "out/app.wasm" }),
        tmp);
    expect(verdict.isStale());
    expect(verdict.reason == "`src/main.rs` is newer than `out/app.wasm`")
        << verdict.reason;
  };

  "targets newer than every source are fresh"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "src/main.rs", "");
    tests::writeFile(tmp / "src/lib.rs", "");
    tests::writeFile(tmp / "out/app.wasm", "");
    tests::setMtime(tmp / "src/main.rs", -60s);
    tests::setMtime(tmp / "src/lib.rs", -50s);
    tests::setMtime(tmp / "src", -50s);
    tests::setMtime(tmp / "out/app.wasm", -10s);

    const auto verdict = verdictOf(
        weld::ExternalCommand::ifStale("build", { "src" }, { "out/app.wasm" }),
        tmp);
    expect(!verdict.isStale());
    expect(verdict.reason == "targets are up to date");
  };

  "a changed file inside a source directory makes the step stale"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "src/nested/deep.rs", "");
    tests::writeFile(tmp / "out/app.wasm", "");
    tests::setMtime(tmp / "src/nested", -120s);
    tests::setMtime(tmp / "src", -120s);
    tests::setMtime(tmp / "out/app.wasm", -60s);
    tests::setMtime(tmp / "src/nested/deep.rs", -5s);

    const auto verdict = verdictOf(
        weld::ExternalCommand::ifStale("build", { "src" }, { "out/app.wasm" }),
        tmp);
    expect(verdict.isStale());
    expect(verdict.reason == "`src/nested/deep.rs` is newer than `out/app.wasm`")
        << verdict.reason;
  };

  "the oldest target decides"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "wit/api.wit", "");
    tests::writeFile(tmp / "gen/a.rs", "");
    tests::writeFile(tmp / "gen/b.rs", "");
    tests::setMtime(tmp / "gen/a.rs", -100s);
    tests::setMtime(tmp / "wit/api.wit", -50s);
    tests::setMtime(tmp / "gen/b.rs", -10s);

    const auto verdict = verdictOf(
        weld::ExternalCommand::ifStale("gen", { "wit/*.wit" }, { "gen/*.rs" }),
        tmp);
    expect(verdict.isStale());
    expect(verdict.reason == "`wit/api.wit` is newer than `gen/a.rs`")
        << verdict.reason;
  };

  "a missing target makes the step stale"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "src/main.rs", "");

    const auto verdict = verdictOf(
        weld::ExternalCommand::ifStale("build", { "src" }, { "out/*.wasm" }),
        tmp);
    expect(verdict.isStale());
    expect(verdict.reason == "target `out/*.wasm` does not exist");
  };

  "empty target lists are always stale"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "src/main.rs", "");

    const auto verdict = verdictOf(
        weld::ExternalCommand::ifStale("check", { "src" }, {}), tmp);
    expect(verdict.isStale());
    expect(verdict.reason == "no targets declared");
  };

  "existing targets with no sources are fresh"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "vendor/lib.wasm", "");

    const auto verdict = verdictOf(
        weld::ExternalCommand::ifStale("fetch", {}, { "vendor/lib.wasm" }),
        tmp);
    expect(!verdict.isStale());
    expect(verdict.reason == "no sources declared");
  };

  "a source pattern that matches nothing is an error"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "out/app.wasm", "");

    const auto verdict = weld::evaluateStaleness(
        weld::ExternalCommand::ifStale("build", { "src/*.rs" },
                                       { "out/app.wasm" }),
        tmp.path);
    expect(verdict.is_err());
    expect(std::string(verdict.unwrap_err()->what())
               .starts_with("source pattern `src/*.rs` matched nothing"));

    // Reported even when the targets are missing as well.
    expect(weld::evaluateStaleness(
               weld::ExternalCommand::ifStale("build", { "src" }, { "gone" }),
               tmp.path)
               .is_err());
  };
}
