// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace ipbeacon {
namespace util {

struct ProcessResult {
  bool started{false};    // fork and exec both succeeded
  bool timed_out{false};  // killed with SIGKILL at the deadline
  int exit_code{-1};      // exit status if the child exited normally
  int term_signal{0};     // signal number if the child was killed by a signal
  std::string output;     // combined stdout and stderr, capped
  std::string error;      // why the child could not be started

  bool Succeeded() const { return started && !timed_out && term_signal == 0 && exit_code == 0; }

  // One-line description for logs ("exit status 1", "timed out after 30s", ...)
  std::string Describe() const;
};

// Run argv[0] (looked up in PATH) with the given arguments, without a shell.
// stdin is /dev/null; stdout and stderr are captured together up to
// max_output bytes (the rest is drained and discarded). The child runs in its
// own process group; if it is still running at the deadline the whole group
// is killed with SIGKILL and the child is reaped.
ProcessResult RunProcess(const std::vector<std::string>& argv, std::chrono::milliseconds timeout,
                         std::size_t max_output = 64 * 1024);

}  // namespace util
}  // namespace ipbeacon
