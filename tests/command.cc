#include "helpers.hpp"

#include "Command.hpp"
#include "Parallelism.hpp"

#include <algorithm>
#include <atomic>
#include <boost/ut.hpp>
#include <chrono>
#include <cstddef>
#include <string>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "shell commands capture both streams and the exit code"_test = [] {
    const auto output =
        weld::Command::shell("echo out; echo err >&2; exit 5").output();
    expect(output.is_ok());
    expect(output.unwrap().stdOut == "out\n");
    expect(output.unwrap().stdErr == "err\n");
    expect(output.unwrap().exitStatus.exitCode() == 5);
  };

  "environment overrides reach the child"_test = [] {
    const weld::Command cmd =
        weld::Command::shell(R"(printf '%s|%s' "$WELD_TEST_GREETING" "$HOME")")
            .setEnv("WELD_TEST_GREETING", "hello")
            .setEnv("HOME", "/nowhere");
    const auto output = cmd.output();
    expect(output.is_ok());
    expect(output.unwrap().stdOut == "hello|/nowhere");
  };

  "a missing working directory exits with 127"_test = [] {
    const tests::TempDir tmp;
    const weld::Command cmd =
        weld::Command::shell("true").setWorkingDirectory(tmp / "missing");
    const auto output = cmd.output();
    expect(output.is_ok());
    expect(output.unwrap().exitStatus.exitCode() == 127);
    expect(output.unwrap().stdErr.find("cannot change directory")
           != std::string::npos);
  };

  "a missing program exits with 127"_test = [] {
    const auto output =
        weld::Command("weld-test-no-such-program").output();
    expect(output.is_ok());
    expect(output.unwrap().exitStatus.exitCode() == 127);
    expect(output.unwrap().stdErr.find("cannot execute") != std::string::npos);
  };

  "quick commands are not held up by slow siblings"_test = [] {
    using Clock = std::chrono::steady_clock;
    constexpr std::size_t numTasks = 8;
    constexpr int quickRuns = 20;

    std::atomic<long long> slowestQuickMs{ 0 };
    std::atomic<int> failures{ 0 };
    weld::WorkerPool pool(numTasks);
    pool.forEach(numTasks, [&](const std::size_t i) {
      if (i % 2 == 0) {
        if (weld::Command::shell("sleep 2").output().is_err()) {
          ++failures;
        }
        return;
      }
      for (int run = 0; run < quickRuns; ++run) {
        const auto start = Clock::now();
        const auto output = weld::Command::shell("true").output();
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now()
                                                                  - start)
                .count();
        if (output.is_err() || !output.unwrap().exitStatus.success()) {
          ++failures;
        }
        long long prev = slowestQuickMs.load();
        while (prev < elapsed
               && !slowestQuickMs.compare_exchange_weak(prev, elapsed)) {
        }
      }
    });

    expect(failures.load() == 0);
    // A leaked pipe write end would keep a quick command waiting for EOF
    // until an unrelated `sleep 2` exits.
    expect(slowestQuickMs.load() < 1500) << slowestQuickMs.load();
  };
}
