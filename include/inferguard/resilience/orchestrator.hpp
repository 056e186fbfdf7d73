#pragma once

#include "inferguard/common/clock.hpp"
#include "inferguard/common/result.hpp"
#include "inferguard/health/monitor.hpp"
#include "inferguard/registry/model_registry.hpp"
#include "inferguard/resilience/attempt.hpp"
#include "inferguard/resilience/backoff.hpp"
#include "inferguard/resilience/circuit_breaker.hpp"
#include "inferguard/resilience/error_classifier.hpp"
#include "inferguard/resilience/error_history.hpp"
#include "inferguard/resilience/rate_limit_tracker.hpp"
#include "inferguard/resilience/response_cache.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace inferguard::resilience {

struct OrchestratorOptions {
  std::chrono::milliseconds attempt_timeout{30'000};
  // Zero leaves requests unbounded apart from per-attempt timeouts.
  std::chrono::milliseconds overall_budget{0};
  std::chrono::seconds retry_after_unattempted{60};
  std::chrono::seconds retry_after_exhausted{300};
  bool cache_enabled = true;
  bool credential_rotation = true;
  CircuitBreakerOptions breaker;
  BackoffOptions backoff;
  std::optional<std::uint64_t> backoff_seed;
};

/// Handed to the request function for one attempt.
struct AttemptContext {
  std::string operation;
  std::size_t credential_index = 0;
  std::chrono::milliseconds timeout{0};
  CancelFlag cancelled;

  [[nodiscard]] bool is_cancelled() const { return cancelled != nullptr && cancelled->load(); }
};

/// Performs the upstream call for one candidate. Call arguments are captured by the
/// callable; errors are returned as text and interpreted only by the classifier.
using RequestFn =
    std::function<common::Result<std::string>(const registry::Candidate &, const AttemptContext &)>;

struct ExecuteOptions {
  std::optional<std::chrono::milliseconds> overall_budget;
  std::optional<std::chrono::milliseconds> attempt_timeout;
  bool use_cache = true;
};

struct AttemptFailure {
  std::string provider;
  std::string model;
  std::size_t credential_index = 0;
  ErrorKind kind = ErrorKind::Unknown;
  Severity severity = Severity::Medium;
  std::string message;
  std::optional<std::uint64_t> retry_after_seconds;
  bool timed_out = false;
};

struct SkippedCandidate {
  std::string provider;
  std::string model;
  std::string reason;
};

/// Terminal failure of execute_with_fallback.
struct FallbackFailure {
  std::string operation;
  std::vector<AttemptFailure> attempts;
  std::vector<SkippedCandidate> skipped;
  std::optional<ErrorKind> dominant_kind;
  std::chrono::seconds retry_after{0};
  bool switch_provider = false;
  bool switch_credential = false;
  // The caller's request was rejected as malformed; no fallback was attempted.
  bool invalid_request = false;

  [[nodiscard]] std::string to_string() const;
};

struct ModelStats {
  std::string model;
  std::uint32_t requests_per_minute_limit = 0;
  std::uint32_t requests_per_day_limit = 0;
  std::size_t requests_last_minute = 0;
  std::size_t requests_today = 0;
  std::uint64_t successes = 0;
  std::uint64_t failures = 0;
  std::optional<std::chrono::system_clock::time_point> rate_limited_until;
  bool available = true;
};

struct ProviderStats {
  std::string name;
  std::string status;
  std::uint32_t priority = 0;
  std::uint32_t requests_per_minute_limit = 0;
  std::uint32_t requests_per_day_limit = 0;
  std::uint32_t burst_limit = 0;
  std::size_t requests_last_minute = 0;
  std::size_t requests_last_hour = 0;
  std::size_t requests_today = 0;
  std::uint64_t error_count = 0;
  std::uint64_t total_errors = 0;
  std::uint32_t backoff_attempt = 0;
  std::optional<std::chrono::system_clock::time_point> cooldown_until;
  std::string circuit_state;
  std::uint32_t circuit_failures = 0;
  std::string health;
  std::size_t credentials_total = 0;
  std::size_t credentials_available = 0;
  bool can_make_request = false;
  std::vector<ModelStats> models;
};

/// Ties admission, circuit breaking, backoff, classification and caching together
/// around an ordered candidate list. All shared state is safe for concurrent requests:
/// each provider's breaker, backoff and credentials sit behind that provider's mutex,
/// the other components guard themselves.
class Orchestrator {
public:
  Orchestrator(std::shared_ptr<const registry::ModelRegistry> registry, OrchestratorOptions options,
               std::shared_ptr<RateLimitTracker> tracker, std::shared_ptr<ResponseCache> cache,
               std::shared_ptr<ErrorHistory> history,
               std::shared_ptr<health::HealthMonitor> health = nullptr,
               std::shared_ptr<common::Clock> clock = common::default_clock());

  /// Returns the first successful response, or the aggregated failure once every
  /// candidate was tried or refused. A fresh cache hit for any candidate provider
  /// short-circuits all calls. An invalid request is returned right away.
  [[nodiscard]] common::Result<std::string, FallbackFailure>
  execute_with_fallback(const std::string &operation,
                        const std::vector<registry::Candidate> &candidates,
                        const RequestFn &request_fn, const CacheParams &cache_key_params = {},
                        const ExecuteOptions &options = {});

  [[nodiscard]] std::vector<ProviderStats> get_provider_stats() const;
  [[nodiscard]] std::string provider_stats_json() const;

  [[nodiscard]] common::Status reset_provider(const std::string &name);
  void reset_all_providers();

  [[nodiscard]] const registry::ModelRegistry &registry() const { return *registry_; }
  [[nodiscard]] const OrchestratorOptions &options() const { return options_; }
  [[nodiscard]] const ErrorClassifier &classifier() const { return classifier_; }
  [[nodiscard]] ErrorHistory &history() { return *history_; }

private:
  struct ProviderState {
    ProviderState(CircuitBreakerOptions breaker_options, BackoffOptions backoff_options,
                  std::optional<std::uint64_t> seed, std::shared_ptr<common::Clock> clock,
                  std::size_t credential_count);

    std::mutex mutex;
    CircuitBreaker breaker;
    ExponentialBackoff backoff;
    // Set after a failure: the provider is not called again before this instant.
    std::optional<common::Clock::time_point> not_before;
    std::vector<bool> credential_disabled;
    std::size_t active_credential = 0;
    std::uint64_t error_count = 0;
  };

  /// What the pre-flight checks decided for one candidate attempt.
  struct Reservation {
    bool granted = false;
    std::string reason;
    common::Clock::duration retry_in{0};
    std::size_t credential_index = 0;
    // Non-zero when backoff must be waited out first; nothing has been claimed then.
    common::Clock::duration wait{0};
  };

  [[nodiscard]] ProviderState *state_for(const std::string &provider) const;
  [[nodiscard]] Reservation reserve(const registry::Candidate &candidate, ProviderState &state,
                                    std::optional<common::Clock::time_point> deadline);
  void on_success(const registry::Candidate &candidate, ProviderState &state);
  /// Returns true when the same candidate should be retried with another credential.
  bool on_failure(const registry::Candidate &candidate, ProviderState &state,
                  const Classification &classification, const std::string &message);
  void finalize_failure(FallbackFailure &failure,
                        const std::vector<common::Clock::duration> &reset_windows) const;

  std::shared_ptr<const registry::ModelRegistry> registry_;
  OrchestratorOptions options_;
  std::shared_ptr<RateLimitTracker> tracker_;
  std::shared_ptr<ResponseCache> cache_;
  std::shared_ptr<ErrorHistory> history_;
  std::shared_ptr<health::HealthMonitor> health_;
  std::shared_ptr<common::Clock> clock_;
  ErrorClassifier classifier_;
  // Built once in the constructor; only the pointed-to states mutate.
  std::unordered_map<std::string, std::unique_ptr<ProviderState>> providers_;
};

} // namespace inferguard::resilience
