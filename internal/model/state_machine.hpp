#pragma once

#include <cstdint>
#include <string_view>

namespace fnpipe::model {

enum class InvocationState : std::uint8_t {
  kPending   = 0,
  kRunning   = 1,
  kSucceeded = 2,
  kFailed    = 3,
  kDeferred  = 4,
};

enum class RunState : std::uint8_t {
  kRunning   = 0,
  kCommitted = 1,
  kAborted   = 2,
};

constexpr bool IsTerminal(InvocationState state) {
  return state == InvocationState::kSucceeded || state == InvocationState::kFailed || state == InvocationState::kDeferred;
}

constexpr bool IsTerminal(RunState state) {
  return state != RunState::kRunning;
}

// Pending -> Running -> {Succeeded | Failed | Deferred}
constexpr bool CanTransition(InvocationState from, InvocationState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (from == InvocationState::kPending) {
    return to == InvocationState::kRunning;
  }
  return IsTerminal(to);
}

// Running -> {Committed | Aborted}
constexpr bool CanTransition(RunState from, RunState to) {
  return from == RunState::kRunning && IsTerminal(to);
}

constexpr std::string_view ToString(InvocationState state) {
  switch (state) {
    case InvocationState::kPending:
      return "pending";
    case InvocationState::kRunning:
      return "running";
    case InvocationState::kSucceeded:
      return "succeeded";
    case InvocationState::kFailed:
      return "failed";
    case InvocationState::kDeferred:
      return "deferred";
  }
  return "unknown";
}

constexpr std::string_view ToString(RunState state) {
  switch (state) {
    case RunState::kRunning:
      return "running";
    case RunState::kCommitted:
      return "committed";
    case RunState::kAborted:
      return "aborted";
  }
  return "unknown";
}

} // namespace fnpipe::model
