/**
 * @file process.cpp
 * @brief Child process execution implementation
 *
 * @note POSIX only: fork/execvp with a CLOEXEC pipe for stderr.
 */

#include "ffrotate/process.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "ffrotate/logging.hpp"

namespace ffrotate {

namespace {

/// Write a message from the forked child without touching the heap
void child_report(int fd, const char *what, int err) {
  const char *reason = std::strerror(err);
  (void)!write(fd, what, std::strlen(what));
  (void)!write(fd, ": ", 2);
  (void)!write(fd, reason, std::strlen(reason));
  (void)!write(fd, "\n", 1);
}

} // anonymous namespace

ProcessResult run_process(const std::vector<std::string> &argv) {
  ProcessResult result;
  if (argv.empty()) {
    result.diagnostics = "empty command line";
    return result;
  }

  /// Build the NULL-terminated argument array before forking
  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &a : argv)
    args.push_back(const_cast<char *>(a.c_str()));
  args.push_back(nullptr);

  int err_pipe[2];
  if (pipe2(err_pipe, O_CLOEXEC) == -1) {
    result.diagnostics = fmt::format("pipe failed: {}", std::strerror(errno));
    LOG_ERROR("{}", result.diagnostics);
    return result;
  }

  pid_t pid = fork();
  if (pid == -1) {
    result.diagnostics = fmt::format("fork failed: {}", std::strerror(errno));
    LOG_ERROR("{}", result.diagnostics);
    close(err_pipe[0]);
    close(err_pipe[1]);
    return result;
  }

  if (pid == 0) {
    /// Child: stderr -> pipe, stdin/stdout -> /dev/null
    int devnull = open("/dev/null", O_RDWR);
    if (devnull != -1) {
      dup2(devnull, STDIN_FILENO);
      dup2(devnull, STDOUT_FILENO);
    }
    dup2(err_pipe[1], STDERR_FILENO);
    execvp(args[0], args.data());
    child_report(STDERR_FILENO, args[0], errno);
    _exit(127);
  }

  result.spawned = true;
  close(err_pipe[1]);

  char buf[4096];
  for (;;) {
    ssize_t n = read(err_pipe[0], buf, sizeof(buf));
    if (n > 0) {
      result.diagnostics.append(buf, static_cast<size_t>(n));
    } else if (n == 0) {
      break;
    } else if (errno != EINTR) {
      LOG_WARN("Reading child diagnostics failed: {}", std::strerror(errno));
      break;
    }
  }
  close(err_pipe[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      result.diagnostics += fmt::format("waitpid failed: {}\n",
                                        std::strerror(errno));
      return result;
    }
  }

  if (WIFEXITED(status)) {
    result.exit_status = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_status = 128 + WTERMSIG(status);
    result.diagnostics +=
        fmt::format("terminated by signal {}\n", WTERMSIG(status));
  }
  return result;
}

std::string format_command(const std::vector<std::string> &argv) {
  std::string line;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0)
      line += ' ';
    if (argv[i].find_first_of(" \t'\"") != std::string::npos) {
      line += '"';
      line += argv[i];
      line += '"';
    } else {
      line += argv[i];
    }
  }
  return line;
}

} // namespace ffrotate
