#include "inferguard/runtime/app.hpp"

#include "inferguard/config/config.hpp"
#include "inferguard/observability/factory.hpp"
#include "inferguard/observability/global.hpp"

namespace inferguard::runtime {

RuntimeContext::RuntimeContext(config::Config config, std::shared_ptr<common::Clock> clock)
    : config_(std::move(config)), clock_(std::move(clock)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.error());
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

resilience::OrchestratorOptions RuntimeContext::orchestrator_options(const config::Config &config) {
  resilience::OrchestratorOptions options;
  options.attempt_timeout = std::chrono::milliseconds(config.resilience.attempt_timeout_ms);
  options.overall_budget = std::chrono::milliseconds(config.resilience.overall_budget_ms);
  options.retry_after_unattempted =
      std::chrono::seconds(config.resilience.retry_after_unattempted_seconds);
  options.retry_after_exhausted =
      std::chrono::seconds(config.resilience.retry_after_exhausted_seconds);
  options.cache_enabled = config.cache.enabled;
  options.credential_rotation = config.resilience.credential_rotation;
  options.breaker = resilience::CircuitBreakerOptions{
      .failure_threshold = config.circuit_breaker.failure_threshold,
      .recovery_timeout = std::chrono::seconds(config.circuit_breaker.recovery_timeout_seconds)};
  options.backoff = resilience::BackoffOptions{.base_seconds = config.backoff.base_seconds,
                                               .multiplier = config.backoff.multiplier,
                                               .max_seconds = config.backoff.max_seconds,
                                               .jitter = config.backoff.jitter};
  return options;
}

health::HealthMonitorOptions RuntimeContext::health_options(const config::Config &config) {
  return health::HealthMonitorOptions{
      .poll_interval = std::chrono::seconds(config.health.poll_interval_seconds),
      .recheck_interval = std::chrono::seconds(config.health.recheck_interval_seconds),
      .failure_threshold = config.health.failure_threshold,
      .probe_timeout = std::chrono::seconds(config.health.probe_timeout_seconds),
      .probe_prompt = config.health.probe_prompt};
}

resilience::CacheOptions RuntimeContext::cache_options(const config::Config &config) {
  return resilience::CacheOptions{.ttl = std::chrono::seconds(config.cache.ttl_seconds),
                                  .max_entries = config.cache.max_entries,
                                  .key_value_prefix_chars = config.cache.key_value_prefix_chars};
}

common::Result<std::shared_ptr<ResilienceStack>>
RuntimeContext::create_stack(std::shared_ptr<providers::HttpClient> http_client) {
  auto registry = registry::ModelRegistry::from_config(config_);
  if (!registry.ok()) {
    return common::Result<std::shared_ptr<ResilienceStack>>::failure(registry.error());
  }
  auto clients = providers::create_clients(registry.value(), std::move(http_client));
  if (!clients.ok()) {
    return common::Result<std::shared_ptr<ResilienceStack>>::failure(clients.error());
  }
  return create_stack_with_clients(std::move(clients.value()));
}

common::Result<std::shared_ptr<ResilienceStack>>
RuntimeContext::create_stack_with_clients(providers::ClientTable clients) {
  using StackResult = common::Result<std::shared_ptr<ResilienceStack>>;

  const auto validation = config::validate_config(config_);
  if (!validation.ok()) {
    return StackResult::failure("invalid config: " + validation.error());
  }

  observability::set_global_observer(observability::create_observer(config_));
  for (const auto &warning : validation.value()) {
    observability::record_error("config", warning);
  }

  auto registry = registry::ModelRegistry::from_config(config_);
  if (!registry.ok()) {
    return StackResult::failure(registry.error());
  }

  auto stack = std::make_shared<ResilienceStack>();
  stack->registry = std::make_shared<const registry::ModelRegistry>(std::move(registry.value()));
  stack->tracker = std::make_shared<resilience::RateLimitTracker>(clock_);
  stack->cache = std::make_shared<resilience::ResponseCache>(cache_options(config_), clock_);
  stack->history = std::make_shared<resilience::ErrorHistory>(config_.errors.history_size);
  stack->clients = std::move(clients);

  if (config_.health.enabled) {
    stack->health = std::make_shared<health::HealthMonitor>(health_options(config_), clock_);
    for (const auto &name : stack->registry->provider_order()) {
      const auto it = stack->clients.find(name);
      if (it == stack->clients.end() || it->second.empty()) {
        continue;
      }
      // Probe with the provider's preferred model.
      const auto candidates =
          stack->registry->rank_candidates(registry::CapabilityRequirement{.providers = {name}});
      if (candidates.empty()) {
        continue;
      }
      const auto *model = stack->registry->find_model(name, candidates.front().model);
      stack->health->register_provider(name, it->second, candidates.front().model,
                                       model != nullptr && model->supports_vision);
    }
  }

  stack->orchestrator = std::make_shared<resilience::Orchestrator>(
      stack->registry, orchestrator_options(config_), stack->tracker, stack->cache, stack->history,
      stack->health, clock_);
  stack->provider = std::make_shared<providers::ReliableProvider>(stack->orchestrator, stack->clients);
  return StackResult::success(std::move(stack));
}

} // namespace inferguard::runtime
