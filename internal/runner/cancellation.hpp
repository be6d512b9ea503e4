#pragma once

#include <atomic>

namespace fnpipe::runner {

/*
  Run-wide cancellation flag.

  Cancel() only stores to a lock-free atomic, so it may be called from a
  signal handler.
*/
class CancellationToken {
 public:
  void Cancel() noexcept {
    cancelled_.store(true, std::memory_order_relaxed);
  }

  bool IsCancelled() const noexcept {
    return cancelled_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

} // namespace fnpipe::runner
