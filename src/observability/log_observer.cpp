#include "inferguard/observability/log_observer.hpp"

#include "inferguard/common/clock.hpp"
#include "inferguard/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace inferguard::observability {

namespace {

const char *level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

std::string target(const std::string &provider, const std::string &model) {
  return model.empty() ? provider : provider + "/" + model;
}

} // namespace

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(std::cerr, min_level) {}

LogObserver::LogObserver(std::ostream &out, const LogLevel min_level)
    : out_(&out), min_level_(min_level) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << common::now_rfc3339() << " [" << level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, AttemptStartEvent>) {
          log_line(LogLevel::Info, "attempt.start target=" + target(evt.provider, evt.model) +
                                       " operation=" + evt.operation);
        } else if constexpr (std::is_same_v<T, AttemptEndEvent>) {
          std::string line = "attempt.end target=" + target(evt.provider, evt.model) +
                             " duration_ms=" + std::to_string(evt.duration.count()) +
                             " success=" + (evt.success ? "true" : "false");
          if (!evt.error_kind.empty()) {
            line += " kind=" + evt.error_kind;
          }
          log_line(evt.success ? LogLevel::Info : LogLevel::Warn, line);
        } else if constexpr (std::is_same_v<T, CandidateSkippedEvent>) {
          log_line(LogLevel::Debug, "candidate.skip target=" + target(evt.provider, evt.model) +
                                        " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, FallbackExhaustedEvent>) {
          log_line(LogLevel::Error, "fallback.exhausted operation=" + evt.operation +
                                        " attempts=" + std::to_string(evt.attempts) +
                                        " dominant=" + evt.dominant_kind + " retry_after_s=" +
                                        std::to_string(evt.retry_after_seconds));
        } else if constexpr (std::is_same_v<T, CacheHitEvent>) {
          log_line(LogLevel::Info,
                   "cache.hit operation=" + evt.operation + " provider=" + evt.provider);
        } else if constexpr (std::is_same_v<T, CircuitTransitionEvent>) {
          log_line(evt.to == "open" ? LogLevel::Warn : LogLevel::Info,
                   "circuit.transition provider=" + evt.provider + " from=" + evt.from +
                       " to=" + evt.to);
        } else if constexpr (std::is_same_v<T, RateLimitedEvent>) {
          log_line(LogLevel::Warn, "ratelimit.marked target=" + target(evt.provider, evt.model) +
                                       " reset_s=" + std::to_string(evt.reset_seconds));
        } else if constexpr (std::is_same_v<T, HealthCheckEvent>) {
          std::string line = "health.check provider=" + evt.provider + " status=" + evt.status;
          if (evt.error.has_value()) {
            line += " error=" + *evt.error;
          }
          log_line(evt.status == "healthy" ? LogLevel::Debug : LogLevel::Warn, line);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, AttemptLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.attempt_latency_ms provider=" + m.provider +
                                        " value=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, CacheEntriesMetric>) {
          log_line(LogLevel::Debug, "metric.cache_entries=" + std::to_string(m.entries));
        } else if constexpr (std::is_same_v<T, ErrorHistoryDepthMetric>) {
          log_line(LogLevel::Debug, "metric.error_history_depth=" + std::to_string(m.depth));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

LogLevel parse_log_level(const std::string &value, const LogLevel fallback) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "info") {
    return LogLevel::Info;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return fallback;
}

} // namespace inferguard::observability
