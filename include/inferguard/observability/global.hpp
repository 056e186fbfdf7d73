#pragma once

#include "inferguard/observability/observer.hpp"

#include <memory>

namespace inferguard::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_attempt_start(const std::string &provider, const std::string &model,
                          const std::string &operation);
void record_attempt_end(const std::string &provider, const std::string &model,
                        std::chrono::milliseconds duration, bool success,
                        const std::string &error_kind = "");
void record_candidate_skipped(const std::string &provider, const std::string &model,
                              const std::string &reason);
void record_circuit_transition(const std::string &provider, const std::string &from,
                               const std::string &to);
void record_rate_limited(const std::string &provider, const std::string &model,
                         std::uint64_t reset_seconds);
void record_health_check(const std::string &provider, const std::string &status,
                         std::optional<std::string> error = std::nullopt);
void record_error(const std::string &component, const std::string &message);

} // namespace inferguard::observability
