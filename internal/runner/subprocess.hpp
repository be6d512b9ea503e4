#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/runner/cancellation.hpp"

namespace fnpipe::runner {

struct ProcessSpec {
  // argv[0] is looked up on PATH when it has no slash.
  std::vector<std::string>                  argv;
  // Empty keeps the caller's working directory.
  std::string                               cwd;
  std::string                               stdin_data;
  std::optional<std::chrono::milliseconds>  timeout;
  const CancellationToken*                  cancellation     = nullptr;
  std::size_t                               max_stderr_bytes = 1 << 20;
};

struct ProcessResult {
  int         exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool        stderr_truncated = false;
  bool        timed_out        = false;
  bool        cancelled        = false;
};

/*
  Spawns argv in its own process group, feeds stdin_data, and collects
  stdout/stderr until both close. On timeout or cancellation the whole
  group is killed with SIGKILL.

  Exit codes follow the shell: 128 + signal for signalled children, 124 on
  timeout, 130 on cancellation.

  Throws RunnerInvocationError when the process cannot be spawned or exec
  fails.
*/
ProcessResult RunProcess(const ProcessSpec& spec);

} // namespace fnpipe::runner
