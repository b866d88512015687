#include "Command.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <poll.h>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <sys/wait.h>
#include <tuple>
#include <unistd.h>
#include <utility>
#include <vector>

namespace weld {

bool ExitStatus::exitedNormally() const noexcept {
  return WIFEXITED(rawStatus);
}

bool ExitStatus::killedBySignal() const noexcept {
  return WIFSIGNALED(rawStatus);
}

int ExitStatus::exitCode() const noexcept {
  if (exitedNormally()) {
    return WEXITSTATUS(rawStatus);
  }
  return -1;
}

int ExitStatus::termSignal() const noexcept {
  if (killedBySignal()) {
    return WTERMSIG(rawStatus);
  }
  return -1;
}

bool ExitStatus::coreDumped() const noexcept {
#ifdef WCOREDUMP
  return killedBySignal() && WCOREDUMP(rawStatus);
#else
  return false;
#endif
}

bool ExitStatus::success() const noexcept {
  return exitedNormally() && exitCode() == EXIT_SUCCESS;
}

std::string ExitStatus::toString() const {
  if (exitedNormally()) {
    return fmt::format("exited with code {}", exitCode());
  } else if (killedBySignal()) {
    return fmt::format("killed by signal {}{}", termSignal(),
                       coreDumped() ? " (core dumped)" : "");
  }
  return fmt::format("unknown status {}", rawStatus);
}

static void closeIfOpen(const int fd) noexcept {
  if (fd != -1) {
    close(fd);
  }
}

rs::Result<ExitStatus> Child::wait() const noexcept {
  int status{};
  while (waitpid(pid, &status, 0) == -1) {
    if (errno == EINTR) {
      continue;
    }
    closeIfOpen(stdOutPipe);
    closeIfOpen(stdErrPipe);
    rs_bail("waitpid() failed: {}", std::strerror(errno));
  }

  closeIfOpen(stdOutPipe);
  closeIfOpen(stdErrPipe);
  return rs::Ok(ExitStatus(status));
}

rs::Result<CommandOutput> Child::waitWithOutput() const noexcept {
  std::string stdOutOutput;
  std::string stdErrOutput;

  std::vector<pollfd> fds;
  if (stdOutPipe != -1) {
    fds.push_back({ .fd = stdOutPipe, .events = POLLIN, .revents = 0 });
  }
  if (stdErrPipe != -1) {
    fds.push_back({ .fd = stdErrPipe, .events = POLLIN, .revents = 0 });
  }

  std::array<char, 4096> buffer{};
  while (!fds.empty()) {
    const int ready = poll(fds.data(), fds.size(), -1);
    if (ready == -1) {
      if (errno == EINTR) {
        continue;
      }
      rs_bail("poll() failed: {}", std::strerror(errno));
    }

    for (auto it = fds.begin(); it != fds.end();) {
      if ((it->revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        ++it;
        continue;
      }

      const ssize_t count = read(it->fd, buffer.data(), buffer.size());
      if (count > 0) {
        std::string& sink = it->fd == stdOutPipe ? stdOutOutput : stdErrOutput;
        sink.append(buffer.data(), static_cast<std::size_t>(count));
        ++it;
      } else if (count == -1 && errno == EINTR) {
        ++it;
      } else {
        // EOF or unrecoverable read error; stop watching this pipe.
        it = fds.erase(it);
      }
    }
  }

  const ExitStatus exitStatus = rs_try(wait());
  return rs::Ok(CommandOutput{ .exitStatus = exitStatus,
                               .stdOut = std::move(stdOutOutput),
                               .stdErr = std::move(stdErrOutput) });
}

Command Command::shell(std::string script) {
  Command cmd("/bin/sh");
  cmd.addArg("-c").addArg(script);
  return cmd;
}

static rs::Result<std::array<int, 2>>
openPipeFor(const Command::IOConfig config) noexcept {
  std::array<int, 2> fds{ -1, -1 };
  if (config == Command::IOConfig::Piped) {
    // Close-on-exec, so children forked concurrently by other workers do
    // not inherit the write end and hold off EOF.
    rs_ensure(pipe2(fds.data(), O_CLOEXEC) == 0, "pipe2() failed: {}",
              std::strerror(errno));
  }
  return rs::Ok(fds);
}

static void redirectChildStream(const Command::IOConfig config,
                                const std::array<int, 2>& fds,
                                const int target) noexcept {
  switch (config) {
  case Command::IOConfig::Null: {
    const int devNull = open("/dev/null", O_WRONLY);
    if (devNull != -1) {
      dup2(devNull, target);
      close(devNull);
    }
    break;
  }
  case Command::IOConfig::Piped:
    close(fds[0]);
    dup2(fds[1], target);
    close(fds[1]);
    break;
  case Command::IOConfig::Inherit:
    break;
  }
}

// Environment for the child: the current one with `overrides` applied.
static std::vector<std::string>
buildEnv(const std::vector<std::pair<std::string, std::string>>& overrides) {
  std::vector<std::string> env;
  // NOLINTNEXTLINE(*-pointer-arithmetic)
  for (char** var = environ; *var != nullptr; ++var) {
    const std::string_view entry = *var;
    const std::string_view name = entry.substr(0, entry.find('='));
    const bool overridden =
        std::ranges::any_of(overrides, [&](const auto& kv) {
          return kv.first == name;
        });
    if (!overridden) {
      env.emplace_back(entry);
    }
  }
  for (const auto& [name, value] : overrides) {
    env.push_back(name + '=' + value);
  }
  return env;
}

static std::vector<char*> toCStrings(std::vector<std::string>& strs) {
  std::vector<char*> ptrs;
  ptrs.reserve(strs.size() + 1);
  for (std::string& str : strs) {
    ptrs.push_back(str.data());
  }
  ptrs.push_back(nullptr);
  return ptrs;
}

rs::Result<Child> Command::spawn() const noexcept {
  const std::array<int, 2> stdOutPipe = rs_try(openPipeFor(stdOutConfig));
  const std::array<int, 2> stdErrPipe = rs_try(openPipeFor(stdErrConfig));

  // The child may only call async-signal-safe functions, so everything it
  // needs, error messages included, is prepared before fork().
  std::vector<std::string> argStorage;
  argStorage.reserve(arguments.size() + 1);
  argStorage.push_back(command);
  argStorage.insert(argStorage.end(), arguments.begin(), arguments.end());
  const std::vector<char*> argv = toCStrings(argStorage);

  std::vector<std::string> envStorage = buildEnv(envVars);
  const std::vector<char*> envp = toCStrings(envStorage);

  const std::string chdirError =
      fmt::format("weld: cannot change directory to {}\n",
                  workingDirectory.string());
  const std::string execError =
      fmt::format("weld: cannot execute {}\n", command);

  spdlog::trace("spawning `{}`{}", toString(),
                workingDirectory.empty()
                    ? std::string()
                    : fmt::format(" in {}", workingDirectory.string()));

  const pid_t pid = fork();
  if (pid == -1) {
    for (const int fd : { stdOutPipe[0], stdOutPipe[1], stdErrPipe[0],
                          stdErrPipe[1] }) {
      closeIfOpen(fd);
    }
    rs_bail("fork() failed: {}", std::strerror(errno));
  }

  if (pid == 0) {
    redirectChildStream(stdOutConfig, stdOutPipe, STDOUT_FILENO);
    redirectChildStream(stdErrConfig, stdErrPipe, STDERR_FILENO);

    if (!workingDirectory.empty()
        && chdir(workingDirectory.c_str()) == -1) {
      std::ignore = write(STDERR_FILENO, chdirError.data(), chdirError.size());
      _exit(127);
    }

    execvpe(argv[0], argv.data(), envp.data());
    std::ignore = write(STDERR_FILENO, execError.data(), execError.size());
    _exit(127);
  }

  if (stdOutConfig == IOConfig::Piped) {
    close(stdOutPipe[1]);
  }
  if (stdErrConfig == IOConfig::Piped) {
    close(stdErrPipe[1]);
  }
  return rs::Ok(Child(pid, stdOutPipe[0], stdErrPipe[0]));
}

rs::Result<CommandOutput> Command::output() const noexcept {
  Command cmd = *this;
  cmd.setStdOutConfig(IOConfig::Piped);
  cmd.setStdErrConfig(IOConfig::Piped);
  return rs_try(cmd.spawn()).waitWithOutput();
}

std::string Command::toString() const {
  std::string res = command;
  for (const std::string& arg : arguments) {
    res += ' ' + arg;
  }
  return res;
}

} // namespace weld
