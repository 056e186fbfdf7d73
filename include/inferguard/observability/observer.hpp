#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace inferguard::observability {

struct AttemptStartEvent {
  std::string provider;
  std::string model;
  std::string operation;
};

struct AttemptEndEvent {
  std::string provider;
  std::string model;
  std::chrono::milliseconds duration{0};
  bool success = false;
  std::string error_kind;
};

struct CandidateSkippedEvent {
  std::string provider;
  std::string model;
  std::string reason;
};

struct FallbackExhaustedEvent {
  std::string operation;
  std::size_t attempts = 0;
  std::string dominant_kind;
  std::uint64_t retry_after_seconds = 0;
};

struct CacheHitEvent {
  std::string operation;
  std::string provider;
};

struct CircuitTransitionEvent {
  std::string provider;
  std::string from;
  std::string to;
};

struct RateLimitedEvent {
  std::string provider;
  std::string model;
  std::uint64_t reset_seconds = 0;
};

struct HealthCheckEvent {
  std::string provider;
  std::string status;
  std::optional<std::string> error;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<AttemptStartEvent, AttemptEndEvent, CandidateSkippedEvent, FallbackExhaustedEvent,
                 CacheHitEvent, CircuitTransitionEvent, RateLimitedEvent, HealthCheckEvent,
                 ErrorEvent>;

struct AttemptLatencyMetric {
  std::string provider;
  std::chrono::milliseconds latency{0};
};

struct CacheEntriesMetric {
  std::uint64_t entries = 0;
};

struct ErrorHistoryDepthMetric {
  std::uint64_t depth = 0;
};

using ObserverMetric = std::variant<AttemptLatencyMetric, CacheEntriesMetric, ErrorHistoryDepthMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace inferguard::observability
