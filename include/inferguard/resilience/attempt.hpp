#pragma once

#include "inferguard/common/result.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace inferguard::resilience {

/// Set once the caller stops waiting for an attempt. Long-running calls may poll it
/// and bail out early; their result is discarded either way.
using CancelFlag = std::shared_ptr<std::atomic<bool>>;

[[nodiscard]] inline CancelFlag make_cancel_flag() {
  return std::make_shared<std::atomic<bool>>(false);
}

struct AttemptOutcome {
  common::Result<std::string> result;
  bool timed_out = false;
  std::chrono::milliseconds elapsed{0};
};

/// Runs `call` on a worker thread and waits at most `timeout` for it. On expiry the
/// cancel flag is raised, the worker is left to finish on its own and a timeout error
/// is returned. Exceptions thrown by `call` become error results. A non-positive
/// timeout runs the call inline without a deadline.
[[nodiscard]] AttemptOutcome run_with_deadline(std::function<common::Result<std::string>()> call,
                                               std::chrono::milliseconds timeout,
                                               const CancelFlag &cancelled);

} // namespace inferguard::resilience
