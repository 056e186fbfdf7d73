#include "inferguard/observability/global.hpp"

#include <mutex>

namespace inferguard::observability {

namespace {

std::mutex g_observer_mutex;
// Shared so that a caller still emitting on another thread keeps the observer alive
// while it is being replaced.
std::shared_ptr<IObserver> g_observer;

std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::shared_ptr<IObserver> previous;
  {
    std::lock_guard<std::mutex> lock(g_observer_mutex);
    previous = std::move(g_observer);
    g_observer = std::move(observer);
  }
  if (previous != nullptr) {
    previous->flush();
  }
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_attempt_start(const std::string &provider, const std::string &model,
                          const std::string &operation) {
  record_event(AttemptStartEvent{.provider = provider, .model = model, .operation = operation});
}

void record_attempt_end(const std::string &provider, const std::string &model,
                        const std::chrono::milliseconds duration, const bool success,
                        const std::string &error_kind) {
  record_event(AttemptEndEvent{.provider = provider,
                               .model = model,
                               .duration = duration,
                               .success = success,
                               .error_kind = error_kind});
  record_metric(AttemptLatencyMetric{.provider = provider, .latency = duration});
}

void record_candidate_skipped(const std::string &provider, const std::string &model,
                              const std::string &reason) {
  record_event(CandidateSkippedEvent{.provider = provider, .model = model, .reason = reason});
}

void record_circuit_transition(const std::string &provider, const std::string &from,
                               const std::string &to) {
  record_event(CircuitTransitionEvent{.provider = provider, .from = from, .to = to});
}

void record_rate_limited(const std::string &provider, const std::string &model,
                         const std::uint64_t reset_seconds) {
  record_event(
      RateLimitedEvent{.provider = provider, .model = model, .reset_seconds = reset_seconds});
}

void record_health_check(const std::string &provider, const std::string &status,
                         std::optional<std::string> error) {
  record_event(
      HealthCheckEvent{.provider = provider, .status = status, .error = std::move(error)});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace inferguard::observability
