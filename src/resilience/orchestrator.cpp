#include "inferguard/resilience/orchestrator.hpp"

#include "inferguard/common/json_util.hpp"
#include "inferguard/observability/global.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <sstream>

namespace inferguard::resilience {

namespace {

std::chrono::seconds ceil_seconds(const common::Clock::duration value) {
  return std::chrono::ceil<std::chrono::seconds>(value);
}

std::chrono::milliseconds to_millis(const common::Clock::duration value) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(value);
}

std::optional<std::chrono::system_clock::time_point>
to_wall(const common::Clock &clock, const std::optional<common::Clock::time_point> &point) {
  if (!point.has_value()) {
    return std::nullopt;
  }
  return common::to_wall_time(clock, *point);
}

std::string wall_json(const std::optional<std::chrono::system_clock::time_point> &point) {
  if (!point.has_value()) {
    return "null";
  }
  const std::string text = common::format_rfc3339(*point);
  return common::json_string_or_null(&text);
}

int severity_rank(const Severity severity) { return static_cast<int>(severity); }

} // namespace

std::string FallbackFailure::to_string() const {
  std::ostringstream out;
  if (invalid_request) {
    out << "invalid request for '" << operation << "'";
    if (!attempts.empty()) {
      out << ": " << attempts.back().message;
    }
    return out.str();
  }

  if (attempts.empty()) {
    out << "no available providers for '" << operation << "'";
  } else {
    out << "all providers failed for '" << operation << "'";
  }
  if (dominant_kind.has_value()) {
    out << " (dominant: " << error_kind_name(*dominant_kind) << ")";
  }
  out << "; retry after " << retry_after.count() << "s";
  for (const auto &attempt : attempts) {
    out << "\n  " << attempt.provider << "/" << attempt.model << " [" << error_kind_name(attempt.kind)
        << "] " << attempt.message;
  }
  for (const auto &skip : skipped) {
    out << "\n  " << skip.provider << "/" << skip.model << " skipped: " << skip.reason;
  }
  return out.str();
}

Orchestrator::ProviderState::ProviderState(CircuitBreakerOptions breaker_options,
                                           BackoffOptions backoff_options,
                                           const std::optional<std::uint64_t> seed,
                                           std::shared_ptr<common::Clock> clock,
                                           const std::size_t credential_count)
    : breaker(breaker_options, std::move(clock)), backoff(backoff_options, seed),
      credential_disabled(std::max<std::size_t>(credential_count, 1), false) {}

Orchestrator::Orchestrator(std::shared_ptr<const registry::ModelRegistry> registry,
                           OrchestratorOptions options, std::shared_ptr<RateLimitTracker> tracker,
                           std::shared_ptr<ResponseCache> cache,
                           std::shared_ptr<ErrorHistory> history,
                           std::shared_ptr<health::HealthMonitor> health,
                           std::shared_ptr<common::Clock> clock)
    : registry_(std::move(registry)), options_(std::move(options)), tracker_(std::move(tracker)),
      cache_(std::move(cache)), history_(std::move(history)), health_(std::move(health)),
      clock_(std::move(clock)) {
  if (registry_ == nullptr) {
    registry_ = std::make_shared<registry::ModelRegistry>();
  }
  if (tracker_ == nullptr) {
    tracker_ = std::make_shared<RateLimitTracker>(clock_);
  }
  if (history_ == nullptr) {
    history_ = std::make_shared<ErrorHistory>();
  }

  std::uint64_t salt = 0;
  for (const auto &provider : registry_->providers()) {
    std::optional<std::uint64_t> seed;
    if (options_.backoff_seed.has_value()) {
      seed = *options_.backoff_seed + salt++;
    }
    providers_.emplace(provider.name, std::make_unique<ProviderState>(
                                          options_.breaker, options_.backoff, seed, clock_,
                                          provider.api_key_env.size()));
    tracker_->configure(provider.name, "",
                        RateLimits{.requests_per_minute = provider.requests_per_minute,
                                   .requests_per_day = provider.requests_per_day,
                                   .burst_limit = provider.burst_limit});
  }
  for (const auto &model : registry_->models()) {
    tracker_->configure(model.provider, model.id,
                        RateLimits{.requests_per_minute = model.requests_per_minute,
                                   .requests_per_day = model.requests_per_day,
                                   .burst_limit = 0});
  }
}

Orchestrator::ProviderState *Orchestrator::state_for(const std::string &provider) const {
  const auto it = providers_.find(provider);
  return it == providers_.end() ? nullptr : it->second.get();
}

Orchestrator::Reservation Orchestrator::reserve(const registry::Candidate &candidate,
                                                ProviderState &state,
                                                const std::optional<common::Clock::time_point> deadline) {
  Reservation reservation;

  if (health_ != nullptr && health_->status(candidate.provider) == health::HealthStatus::Unhealthy) {
    reservation.reason = "provider unhealthy";
    return reservation;
  }

  // Early refusal so a limited model is not waited on; try_acquire below is the
  // authoritative claim.
  if (const Admission admission = tracker_->check(candidate.provider, candidate.model);
      !admission.admitted) {
    reservation.reason = admission.reason;
    reservation.retry_in = admission.retry_in;
    return reservation;
  }

  std::lock_guard<std::mutex> lock(state.mutex);

  const auto usable = [&](const std::size_t index) { return !state.credential_disabled[index]; };
  const std::size_t count = state.credential_disabled.size();
  std::optional<std::size_t> credential;
  for (std::size_t offset = 0; offset < count; ++offset) {
    const std::size_t index = (state.active_credential + offset) % count;
    if (usable(index)) {
      credential = index;
      break;
    }
  }
  if (!credential.has_value()) {
    reservation.reason = "no usable credentials";
    return reservation;
  }

  if (!state.breaker.would_allow()) {
    reservation.reason = "circuit " + std::string(circuit_state_name(state.breaker.state()));
    reservation.retry_in = state.breaker.remaining_open();
    return reservation;
  }

  const auto now = clock_->now();
  common::Clock::duration wait{0};
  if (state.not_before.has_value() && *state.not_before > now) {
    wait = *state.not_before - now;
  }
  if (deadline.has_value() && now + wait >= *deadline) {
    reservation.reason = "backoff exceeds remaining budget";
    reservation.retry_in = wait;
    return reservation;
  }
  if (wait > common::Clock::duration::zero()) {
    // Nothing is claimed yet; the caller sleeps and asks again.
    reservation.wait = wait;
    return reservation;
  }

  // Claimed before can_attempt() so a denied slot never leaves a half-open probe pending.
  const Admission admission = tracker_->try_acquire(candidate.provider, candidate.model);
  if (!admission.admitted) {
    reservation.reason = admission.reason;
    reservation.retry_in = admission.retry_in;
    return reservation;
  }

  const CircuitState before = state.breaker.state();
  if (!state.breaker.can_attempt()) {
    reservation.reason = "circuit " + std::string(circuit_state_name(state.breaker.state()));
    return reservation;
  }
  if (state.breaker.state() != before) {
    observability::record_circuit_transition(candidate.provider,
                                             std::string(circuit_state_name(before)),
                                             std::string(circuit_state_name(state.breaker.state())));
  }

  state.active_credential = *credential;
  reservation.granted = true;
  reservation.credential_index = *credential;
  return reservation;
}

void Orchestrator::on_success(const registry::Candidate &candidate, ProviderState &state) {
  tracker_->record(candidate.provider, candidate.model, true);

  std::lock_guard<std::mutex> lock(state.mutex);
  const CircuitState before = state.breaker.state();
  state.breaker.record_success();
  state.backoff.reset();
  state.not_before.reset();
  state.error_count = 0;
  if (before != CircuitState::Closed) {
    observability::record_circuit_transition(candidate.provider,
                                             std::string(circuit_state_name(before)), "closed");
  }
}

bool Orchestrator::on_failure(const registry::Candidate &candidate, ProviderState &state,
                              const Classification &classification, const std::string &message) {
  tracker_->record(candidate.provider, candidate.model, false);

  std::size_t credential_index = 0;
  bool retry_with_next_credential = false;
  {
    std::lock_guard<std::mutex> lock(state.mutex);
    credential_index = state.active_credential;
    const CircuitState before = state.breaker.state();

    if (classification.kind == ErrorKind::InvalidRequest) {
      // The provider answered; a pending probe resolves as a success.
      if (before == CircuitState::HalfOpen) {
        state.breaker.record_success();
        observability::record_circuit_transition(candidate.provider, "half_open", "closed");
      }
    } else {
      state.breaker.record_failure();
      ++state.error_count;
      state.not_before = clock_->now() + state.backoff.next_delay();
      if (state.breaker.state() != before) {
        observability::record_circuit_transition(
            candidate.provider, std::string(circuit_state_name(before)),
            std::string(circuit_state_name(state.breaker.state())));
      }
    }

    const bool credential_fatal = classification.policy.switch_credential &&
                                  !classification.policy.retryable;
    if (credential_fatal && options_.credential_rotation) {
      state.credential_disabled[credential_index] = true;
      const std::size_t count = state.credential_disabled.size();
      for (std::size_t offset = 1; offset < count; ++offset) {
        const std::size_t next = (credential_index + offset) % count;
        if (!state.credential_disabled[next]) {
          state.active_credential = next;
          retry_with_next_credential = true;
          break;
        }
      }
    }
  }

  history_->record(ErrorRecord{.timestamp = common::to_wall_time(*clock_, clock_->now()),
                               .kind = classification.kind,
                               .severity = classification.severity,
                               .provider = candidate.provider,
                               .key_index = credential_index,
                               .message = message});
  observability::record_metric(
      observability::ErrorHistoryDepthMetric{.depth = static_cast<std::uint64_t>(history_->size())});

  if (classification.kind == ErrorKind::RateLimit ||
      classification.kind == ErrorKind::QuotaExceeded) {
    const auto window =
        RateLimitTracker::reset_window_for(message, classification.retry_after_seconds);
    tracker_->mark_limited(candidate.provider, candidate.model, window);
    observability::record_rate_limited(candidate.provider, candidate.model,
                                       static_cast<std::uint64_t>(window.count()));
    if (classification.kind == ErrorKind::QuotaExceeded) {
      if (const auto *provider = registry_->find_provider(candidate.provider); provider != nullptr) {
        tracker_->mark_limited(candidate.provider, "", provider->cooldown);
        observability::record_rate_limited(candidate.provider, "",
                                           static_cast<std::uint64_t>(provider->cooldown.count()));
      }
    }
  }

  return retry_with_next_credential;
}

void Orchestrator::finalize_failure(FallbackFailure &failure,
                                    const std::vector<common::Clock::duration> &reset_windows) const {
  if (!failure.attempts.empty()) {
    std::map<ErrorKind, std::size_t> frequency;
    for (const auto &attempt : failure.attempts) {
      ++frequency[attempt.kind];
    }
    // Highest severity wins; ties go to the more frequent kind, then the earlier one.
    const AttemptFailure *dominant = nullptr;
    for (const auto &attempt : failure.attempts) {
      if (dominant == nullptr) {
        dominant = &attempt;
        continue;
      }
      const int rank = severity_rank(attempt.severity);
      const int best = severity_rank(dominant->severity);
      if (rank > best || (rank == best && frequency[attempt.kind] > frequency[dominant->kind])) {
        dominant = &attempt;
      }
    }
    failure.dominant_kind = dominant->kind;
    const RecoveryPolicy &policy = ErrorClassifier::policy_for(dominant->kind);
    failure.switch_provider = policy.switch_provider;
    failure.switch_credential = policy.switch_credential;
  }

  std::optional<common::Clock::duration> shortest;
  const auto consider = [&](const common::Clock::duration value) {
    if (value <= common::Clock::duration::zero()) {
      return;
    }
    if (!shortest.has_value() || value < *shortest) {
      shortest = value;
    }
  };
  for (const auto window : reset_windows) {
    consider(window);
  }
  for (const auto &attempt : failure.attempts) {
    // Limit errors already contributed the window the model is now marked for.
    if (attempt.kind == ErrorKind::RateLimit || attempt.kind == ErrorKind::QuotaExceeded) {
      continue;
    }
    if (ErrorClassifier::policy_for(attempt.kind).retryable) {
      consider(ErrorClassifier::recommended_backoff(attempt.kind, 0, attempt.retry_after_seconds));
    }
  }

  if (shortest.has_value()) {
    failure.retry_after = ceil_seconds(*shortest);
  } else if (failure.attempts.empty()) {
    failure.retry_after = options_.retry_after_unattempted;
  } else {
    failure.retry_after = options_.retry_after_exhausted;
  }
}

common::Result<std::string, FallbackFailure>
Orchestrator::execute_with_fallback(const std::string &operation,
                                    const std::vector<registry::Candidate> &candidates,
                                    const RequestFn &request_fn, const CacheParams &cache_key_params,
                                    const ExecuteOptions &options) {
  using Outcome = common::Result<std::string, FallbackFailure>;

  const bool caching = options.use_cache && options_.cache_enabled && cache_ != nullptr &&
                       !cache_key_params.empty();
  if (caching) {
    std::set<std::string> seen;
    for (const auto &candidate : candidates) {
      if (!seen.insert(candidate.provider).second) {
        continue;
      }
      if (auto cached = cache_->get(candidate.provider, operation, cache_key_params);
          cached.has_value()) {
        observability::record_event(
            observability::CacheHitEvent{.operation = operation, .provider = candidate.provider});
        return Outcome::success(std::move(*cached));
      }
    }
  }

  const auto started = clock_->now();
  const auto budget = options.overall_budget.value_or(options_.overall_budget);
  std::optional<common::Clock::time_point> deadline;
  if (budget.count() > 0) {
    deadline = started + budget;
  }
  const auto attempt_timeout = options.attempt_timeout.value_or(options_.attempt_timeout);

  FallbackFailure failure;
  failure.operation = operation;
  std::vector<common::Clock::duration> reset_windows;
  std::set<std::string> blocked;

  const auto skip = [&](const registry::Candidate &candidate, std::string reason,
                        const common::Clock::duration retry_in) {
    observability::record_candidate_skipped(candidate.provider, candidate.model, reason);
    failure.skipped.push_back(SkippedCandidate{
        .provider = candidate.provider, .model = candidate.model, .reason = std::move(reason)});
    if (retry_in > common::Clock::duration::zero()) {
      reset_windows.push_back(retry_in);
    }
  };

  for (const auto &candidate : candidates) {
    ProviderState *state = state_for(candidate.provider);
    if (state == nullptr) {
      skip(candidate, "unknown provider", common::Clock::duration::zero());
      continue;
    }
    if (blocked.contains(candidate.provider)) {
      skip(candidate, "provider refused earlier in this request", common::Clock::duration::zero());
      continue;
    }

    bool retry_same_candidate = true;
    while (retry_same_candidate) {
      retry_same_candidate = false;

      if (deadline.has_value() && clock_->now() >= *deadline) {
        skip(candidate, "overall budget exhausted", common::Clock::duration::zero());
        break;
      }

      Reservation reservation = reserve(candidate, *state, deadline);
      while (!reservation.granted && reservation.wait > common::Clock::duration::zero()) {
        clock_->sleep_for(std::chrono::ceil<std::chrono::milliseconds>(reservation.wait));
        reservation = reserve(candidate, *state, deadline);
      }
      if (!reservation.granted) {
        skip(candidate, reservation.reason, reservation.retry_in);
        break;
      }

      std::chrono::milliseconds timeout = attempt_timeout;
      if (deadline.has_value()) {
        const auto remaining = to_millis(*deadline - clock_->now());
        if (timeout.count() <= 0 || remaining < timeout) {
          timeout = std::max(remaining, std::chrono::milliseconds(1));
        }
      }

      AttemptContext context{.operation = operation,
                             .credential_index = reservation.credential_index,
                             .timeout = timeout,
                             .cancelled = make_cancel_flag()};
      observability::record_attempt_start(candidate.provider, candidate.model, operation);
      const auto attempt_started = clock_->now();
      AttemptOutcome outcome = run_with_deadline(
          [request_fn, candidate, context]() { return request_fn(candidate, context); }, timeout,
          context.cancelled);
      const auto elapsed = outcome.elapsed.count() > 0 ? outcome.elapsed
                                                       : to_millis(clock_->now() - attempt_started);

      if (outcome.result.ok()) {
        on_success(candidate, *state);
        observability::record_attempt_end(candidate.provider, candidate.model, elapsed, true);
        if (caching) {
          cache_->put(candidate.provider, operation, cache_key_params, outcome.result.value());
        }
        return Outcome::success(std::move(outcome.result.value()));
      }

      const std::string message = outcome.result.error();
      Classification classification = classifier_.classify(message);
      if (outcome.timed_out) {
        classification.kind = ErrorKind::Timeout;
        classification.policy = ErrorClassifier::policy_for(ErrorKind::Timeout);
        classification.severity = classification.policy.severity;
      }
      observability::record_attempt_end(candidate.provider, candidate.model, elapsed, false,
                                        std::string(error_kind_name(classification.kind)));

      retry_same_candidate = on_failure(candidate, *state, classification, message);

      failure.attempts.push_back(AttemptFailure{.provider = candidate.provider,
                                                .model = candidate.model,
                                                .credential_index = reservation.credential_index,
                                                .kind = classification.kind,
                                                .severity = classification.severity,
                                                .message = message,
                                                .retry_after_seconds = classification.retry_after_seconds,
                                                .timed_out = outcome.timed_out});

      if (classification.kind == ErrorKind::InvalidRequest) {
        failure.invalid_request = true;
        failure.dominant_kind = ErrorKind::InvalidRequest;
        failure.retry_after = std::chrono::seconds(0);
        return Outcome::failure(std::move(failure));
      }
      if (classification.kind == ErrorKind::RateLimit ||
          classification.kind == ErrorKind::QuotaExceeded) {
        reset_windows.push_back(
            RateLimitTracker::reset_window_for(message, classification.retry_after_seconds));
      }

      const auto &policy = classification.policy;
      if (!retry_same_candidate) {
        const bool credential_fatal = policy.switch_credential && !policy.retryable;
        if (credential_fatal || classification.kind == ErrorKind::Authorization) {
          blocked.insert(candidate.provider);
        }
      }
    }
  }

  finalize_failure(failure, reset_windows);
  observability::record_event(observability::FallbackExhaustedEvent{
      .operation = operation,
      .attempts = failure.attempts.size(),
      .dominant_kind =
          failure.dominant_kind.has_value() ? std::string(error_kind_name(*failure.dominant_kind)) : "",
      .retry_after_seconds = static_cast<std::uint64_t>(failure.retry_after.count())});
  return Outcome::failure(std::move(failure));
}

std::vector<ProviderStats> Orchestrator::get_provider_stats() const {
  std::vector<ProviderStats> out;
  const auto now = clock_->now();

  for (const auto &provider : registry_->providers()) {
    ProviderState *state = state_for(provider.name);
    if (state == nullptr) {
      continue;
    }

    ProviderStats stats;
    stats.name = provider.name;
    stats.priority = provider.priority;
    stats.requests_per_minute_limit = provider.requests_per_minute;
    stats.requests_per_day_limit = provider.requests_per_day;
    stats.burst_limit = provider.burst_limit;

    const UsageSnapshot usage = tracker_->snapshot(provider.name, "");
    stats.requests_last_minute = usage.last_minute;
    stats.requests_last_hour = usage.last_hour;
    stats.requests_today = usage.last_day;
    stats.cooldown_until = to_wall(*clock_, usage.rate_limited_until);
    stats.total_errors = history_->provider_error_count(provider.name);

    bool circuit_allows = false;
    CircuitState circuit = CircuitState::Closed;
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      stats.error_count = state->error_count;
      stats.backoff_attempt = state->backoff.attempt();
      circuit = state->breaker.state();
      stats.circuit_state = std::string(circuit_state_name(circuit));
      stats.circuit_failures = state->breaker.failure_count();
      stats.credentials_total = state->credential_disabled.size();
      stats.credentials_available = static_cast<std::size_t>(
          std::count(state->credential_disabled.begin(), state->credential_disabled.end(), false));
      circuit_allows = state->breaker.would_allow();
    }

    stats.health = health_ != nullptr
                       ? std::string(health::health_status_name(health_->status(provider.name)))
                       : "unknown";

    bool any_model_limited = false;
    for (const auto *model : registry_->models_for(provider.name)) {
      const UsageSnapshot model_usage = tracker_->snapshot(provider.name, model->id);
      ModelStats model_stats;
      model_stats.model = model->id;
      model_stats.requests_per_minute_limit = model->requests_per_minute;
      model_stats.requests_per_day_limit = model->requests_per_day;
      model_stats.requests_last_minute = model_usage.last_minute;
      model_stats.requests_today = model_usage.last_day;
      model_stats.successes = model_usage.successes;
      model_stats.failures = model_usage.failures;
      model_stats.rate_limited_until = to_wall(*clock_, model_usage.rate_limited_until);
      model_stats.available = tracker_->admit(provider.name, model->id);
      any_model_limited = any_model_limited || model_usage.rate_limited_until.has_value();
      stats.models.push_back(std::move(model_stats));
    }

    const bool in_cooldown = usage.rate_limited_until.has_value() && *usage.rate_limited_until > now;
    if (stats.credentials_available == 0) {
      stats.status = "temporarily_disabled";
    } else if (in_cooldown) {
      stats.status = "quota_exceeded";
    } else if (circuit != CircuitState::Closed) {
      stats.status = "error";
    } else if (any_model_limited) {
      stats.status = "rate_limited";
    } else {
      stats.status = "active";
    }

    stats.can_make_request = provider.enabled && stats.credentials_available > 0 &&
                             circuit_allows && tracker_->admit(provider.name, "") &&
                             stats.health != "unhealthy";
    out.push_back(std::move(stats));
  }
  return out;
}

std::string Orchestrator::provider_stats_json() const {
  const auto stats = get_provider_stats();
  std::ostringstream out;
  out << "{";
  for (std::size_t i = 0; i < stats.size(); ++i) {
    const auto &entry = stats[i];
    if (i > 0) {
      out << ",";
    }
    out << "\"" << common::json_escape(entry.name) << "\":{";
    out << "\"status\":\"" << entry.status << "\",";
    out << "\"priority\":" << entry.priority << ",";
    out << "\"requests_per_minute_limit\":" << entry.requests_per_minute_limit << ",";
    out << "\"requests_per_day_limit\":" << entry.requests_per_day_limit << ",";
    out << "\"burst_limit\":" << entry.burst_limit << ",";
    out << "\"requests_last_minute\":" << entry.requests_last_minute << ",";
    out << "\"requests_last_hour\":" << entry.requests_last_hour << ",";
    out << "\"requests_today\":" << entry.requests_today << ",";
    out << "\"error_count\":" << entry.error_count << ",";
    out << "\"total_errors\":" << entry.total_errors << ",";
    out << "\"backoff_attempt\":" << entry.backoff_attempt << ",";
    out << "\"cooldown_until\":" << wall_json(entry.cooldown_until) << ",";
    out << "\"circuit_state\":\"" << entry.circuit_state << "\",";
    out << "\"circuit_failures\":" << entry.circuit_failures << ",";
    out << "\"health\":\"" << entry.health << "\",";
    out << "\"credentials_available\":" << entry.credentials_available << ",";
    out << "\"credentials_total\":" << entry.credentials_total << ",";
    out << "\"can_make_request\":" << (entry.can_make_request ? "true" : "false") << ",";
    out << "\"models\":{";
    for (std::size_t m = 0; m < entry.models.size(); ++m) {
      const auto &model = entry.models[m];
      if (m > 0) {
        out << ",";
      }
      out << "\"" << common::json_escape(model.model) << "\":{";
      out << "\"requests_last_minute\":" << model.requests_last_minute << ",";
      out << "\"requests_today\":" << model.requests_today << ",";
      out << "\"successes\":" << model.successes << ",";
      out << "\"failures\":" << model.failures << ",";
      out << "\"rate_limited_until\":" << wall_json(model.rate_limited_until) << ",";
      out << "\"available\":" << (model.available ? "true" : "false");
      out << "}";
    }
    out << "}}";
  }
  out << "}";
  return out.str();
}

common::Status Orchestrator::reset_provider(const std::string &name) {
  ProviderState *state = state_for(name);
  if (state == nullptr) {
    return common::Status::error("unknown provider: " + name);
  }
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->breaker.reset();
    state->backoff.reset();
    state->not_before.reset();
    state->error_count = 0;
    state->active_credential = 0;
    std::fill(state->credential_disabled.begin(), state->credential_disabled.end(), false);
  }
  tracker_->reset(name);
  if (health_ != nullptr) {
    health_->reset(name);
  }
  return common::Status::success();
}

void Orchestrator::reset_all_providers() {
  for (const auto &provider : registry_->providers()) {
    const auto status = reset_provider(provider.name);
    if (!status.ok()) {
      observability::record_error("orchestrator", status.error());
    }
  }
}

} // namespace inferguard::resilience
