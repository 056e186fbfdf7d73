#include "inferguard/resilience/attempt.hpp"

#include <future>
#include <thread>

namespace inferguard::resilience {

namespace {

using Outcome = common::Result<std::string>;

Outcome invoke_guarded(const std::function<Outcome()> &call) {
  try {
    return call();
  } catch (const std::exception &ex) {
    return Outcome::failure(ex.what());
  } catch (...) {
    return Outcome::failure("request function threw a non-standard exception");
  }
}

std::chrono::milliseconds since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

} // namespace

AttemptOutcome run_with_deadline(std::function<common::Result<std::string>()> call,
                                 const std::chrono::milliseconds timeout,
                                 const CancelFlag &cancelled) {
  const auto start = std::chrono::steady_clock::now();
  if (timeout.count() <= 0) {
    auto result = invoke_guarded(call);
    return AttemptOutcome{.result = std::move(result), .timed_out = false, .elapsed = since(start)};
  }

  auto promise = std::make_shared<std::promise<Outcome>>();
  auto future = promise->get_future();
  std::thread worker([promise, call = std::move(call)]() {
    promise->set_value(invoke_guarded(call));
  });
  worker.detach();

  if (future.wait_for(timeout) == std::future_status::timeout) {
    if (cancelled != nullptr) {
      cancelled->store(true);
    }
    return AttemptOutcome{
        .result = Outcome::failure("attempt timed out after " + std::to_string(timeout.count()) +
                                   "ms"),
        .timed_out = true,
        .elapsed = since(start)};
  }
  auto result = future.get();
  return AttemptOutcome{.result = std::move(result), .timed_out = false, .elapsed = since(start)};
}

} // namespace inferguard::resilience
