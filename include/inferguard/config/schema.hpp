#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inferguard::config {

struct ResilienceConfig {
  std::uint64_t attempt_timeout_ms = 30'000;
  // 0 leaves a request unbounded apart from its per-attempt timeouts.
  std::uint64_t overall_budget_ms = 0;
  std::uint64_t retry_after_unattempted_seconds = 60;
  std::uint64_t retry_after_exhausted_seconds = 300;
  bool credential_rotation = true;
};

struct BackoffConfig {
  double base_seconds = 1.0;
  double multiplier = 2.0;
  double max_seconds = 300.0;
  double jitter = 0.25;
};

struct CircuitBreakerConfig {
  std::uint32_t failure_threshold = 3;
  std::uint64_t recovery_timeout_seconds = 60;
};

struct CacheConfig {
  bool enabled = true;
  std::uint64_t ttl_seconds = 1800;
  std::size_t max_entries = 1000;
  // When non-zero, parameter values longer than this are cut to this prefix before hashing.
  std::size_t key_value_prefix_chars = 0;
};

struct HealthConfig {
  bool enabled = true;
  std::uint64_t poll_interval_seconds = 60;
  std::uint64_t recheck_interval_seconds = 300;
  std::uint32_t failure_threshold = 3;
  std::uint64_t probe_timeout_seconds = 10;
  std::string probe_prompt = "Health check test";
};

struct ErrorsConfig {
  std::size_t history_size = 1000;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string log_level = "info";
};

struct ModelConfig {
  std::string id;
  std::uint64_t context_length = 8192;
  std::vector<std::string> capabilities;
  // Unset limits inherit the owning provider's limits.
  std::optional<std::uint32_t> requests_per_minute;
  std::optional<std::uint32_t> requests_per_day;
  std::uint32_t priority = 1;
  bool supports_vision = false;
  std::string cost_category = "free";
};

struct ProviderConfig {
  std::string name;
  std::string base_url;
  std::vector<std::string> api_key_env;
  std::uint32_t requests_per_minute = 60;
  std::uint32_t requests_per_day = 1000;
  std::uint32_t burst_limit = 10;
  std::uint64_t cooldown_seconds = 300;
  std::uint32_t priority = 1;
  bool enabled = true;
  std::vector<ModelConfig> models;
};

struct Config {
  ResilienceConfig resilience;
  BackoffConfig backoff;
  CircuitBreakerConfig circuit_breaker;
  CacheConfig cache;
  HealthConfig health;
  ErrorsConfig errors;
  ObservabilityConfig observability;
  std::vector<ProviderConfig> providers;
};

} // namespace inferguard::config
