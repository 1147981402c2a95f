// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/subprocess.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ipbeacon {
namespace util {

namespace {

// pipe() + FD_CLOEXEC on both ends (pipe2 is not available on macOS)
bool make_cloexec_pipe(int fds[2]) {
  if (pipe(fds) != 0) {
    return false;
  }
  for (int i = 0; i < 2; ++i) {
    int flags = fcntl(fds[i], F_GETFD);
    if (flags < 0 || fcntl(fds[i], F_SETFD, flags | FD_CLOEXEC) != 0) {
      close(fds[0]);
      close(fds[1]);
      return false;
    }
  }
  return true;
}

void close_fd(int& fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

// Only async-signal-safe calls between fork() and exec().
[[noreturn]] void exec_child(char* const* argv, int output_fd, int exec_error_fd) {
  int dev_null = open("/dev/null", O_RDONLY);
  if (dev_null >= 0) {
    dup2(dev_null, STDIN_FILENO);
    if (dev_null != STDIN_FILENO) {
      close(dev_null);
    }
  }
  dup2(output_fd, STDOUT_FILENO);
  dup2(output_fd, STDERR_FILENO);

  // Ignored signals survive exec; the parent ignores SIGPIPE.
  signal(SIGPIPE, SIG_DFL);

  // Own process group, so a timeout also kills what the program spawned
  // (scp runs ssh). Done before exec, which the parent waits for.
  setpgid(0, 0);

  execvp(argv[0], argv);

  int err = errno;
  ssize_t ignored = write(exec_error_fd, &err, sizeof(err));
  (void)ignored;
  _exit(127);
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

void record_status(ProcessResult& result, int status) {
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }
}

}  // namespace

std::string ProcessResult::Describe() const {
  if (!started) {
    return "failed to start: " + error;
  }
  if (timed_out) {
    return "timed out";
  }
  if (term_signal != 0) {
    return "killed by signal " + std::to_string(term_signal);
  }
  return "exit status " + std::to_string(exit_code);
}

ProcessResult RunProcess(const std::vector<std::string>& argv, std::chrono::milliseconds timeout,
                         std::size_t max_output) {
  ProcessResult result;

  if (argv.empty() || argv.front().empty()) {
    result.error = "empty command";
    return result;
  }

  std::vector<std::string> storage(argv);
  std::vector<char*> argv_ptrs;
  argv_ptrs.reserve(storage.size() + 1);
  for (auto& arg : storage) {
    argv_ptrs.push_back(arg.data());
  }
  argv_ptrs.push_back(nullptr);

  int output_pipe[2] = {-1, -1};
  int exec_error_pipe[2] = {-1, -1};
  if (!make_cloexec_pipe(output_pipe)) {
    result.error = std::string("pipe: ") + std::strerror(errno);
    return result;
  }
  if (!make_cloexec_pipe(exec_error_pipe)) {
    result.error = std::string("pipe: ") + std::strerror(errno);
    close_fd(output_pipe[0]);
    close_fd(output_pipe[1]);
    return result;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  pid_t pid = fork();
  if (pid < 0) {
    result.error = std::string("fork: ") + std::strerror(errno);
    close_fd(output_pipe[0]);
    close_fd(output_pipe[1]);
    close_fd(exec_error_pipe[0]);
    close_fd(exec_error_pipe[1]);
    return result;
  }

  if (pid == 0) {
    exec_child(argv_ptrs.data(), output_pipe[1], exec_error_pipe[1]);
  }

  close_fd(output_pipe[1]);
  close_fd(exec_error_pipe[1]);

  // The exec-error pipe is closed by exec (CLOEXEC) on success, so this read
  // returns 0 bytes once the program is running, or errno if exec failed.
  int exec_errno = 0;
  ssize_t n;
  do {
    n = read(exec_error_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(exec_error_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    close_fd(output_pipe[0]);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    result.error = argv.front() + ": " + std::strerror(exec_errno);
    return result;
  }

  result.started = true;
  LOG_TRACE("RunProcess: started {} (pid {})", argv.front(), pid);

  // Drain output until EOF or deadline
  bool output_open = true;
  while (output_open) {
    int wait_ms = remaining_ms(deadline);
    if (wait_ms == 0) {
      break;
    }

    struct pollfd pfd;
    pfd.fd = output_pipe[0];
    pfd.events = POLLIN;
    pfd.revents = 0;
    int rc = poll(&pfd, 1, wait_ms);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (rc == 0) {
      continue;  // re-check deadline
    }

    char buf[4096];
    ssize_t got = read(output_pipe[0], buf, sizeof(buf));
    if (got < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      break;
    }
    if (got == 0) {
      output_open = false;
      break;
    }
    if (result.output.size() < max_output) {
      result.output.append(buf, std::min(static_cast<std::size_t>(got), max_output - result.output.size()));
    }
  }
  close_fd(output_pipe[0]);

  // The child may have closed its output but still be running
  while (true) {
    int status = 0;
    pid_t done = waitpid(pid, &status, WNOHANG);
    if (done == pid) {
      record_status(result, status);
      return result;
    }
    if (done < 0 && errno != EINTR) {
      result.error = std::string("waitpid: ") + std::strerror(errno);
      return result;
    }
    if (remaining_ms(deadline) == 0) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  LOG_DEBUG("RunProcess: {} (pid {}) exceeded {}ms, killing its process group", argv.front(), pid,
            timeout.count());
  if (kill(-pid, SIGKILL) != 0) {
    kill(pid, SIGKILL);
  }
  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  result.timed_out = true;
  return result;
}

}  // namespace util
}  // namespace ipbeacon
