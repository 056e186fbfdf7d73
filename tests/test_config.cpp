#include "test_framework.hpp"

#include "inferguard/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <optional>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = inferguard::config::config_path_override();
    if (next.has_value()) {
      inferguard::config::set_config_path_override(*next);
    } else {
      inferguard::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      inferguard::config::set_config_path_override(*old_override);
    } else {
      inferguard::config::clear_config_path_override();
    }
  }
};

constexpr const char *kCatalogue = R"(
[resilience]
attempt_timeout_ms = 5000
overall_budget_ms = 20_000
credential_rotation = false

[backoff]
base_seconds = 0.5
multiplier = 3.0
max_seconds = 60
jitter = 0.0

[circuit_breaker]
failure_threshold = 5
recovery_timeout_seconds = 120

[cache]
ttl_seconds = 600
max_entries = 50

[health]
enabled = false
probe_prompt = "ping"

[observability]
backend = "none"

[[providers]]
name = "openrouter"
api_key_env = ["OPENROUTER_KEY_1", "OPENROUTER_KEY_2"]
requests_per_minute = 20
requests_per_day = 200
priority = 1

[[providers.models]]
id = "vision-large"
context_length = 128000
capabilities = ["Vision", "analysis"]
requests_per_minute = 5
priority = 2

[[providers.models]]
id = "text-small"
capabilities = ["reasoning"]

[[providers]]
name = "groq"
api_key_env = "GROQ_API_KEY"
priority = 2
enabled = false

[[providers.models]]
id = "llama"
cost_category = "paid"
)";

} // namespace

void register_config_tests(std::vector<inferguard::tests::TestCase> &tests) {
  using inferguard::tests::require;
  namespace cfg = inferguard::config;

  tests.push_back({"config_parse_sections", [] {
                     auto parsed = cfg::parse_config(kCatalogue);
                     require(parsed.ok(), parsed.error_message());
                     const auto &config = parsed.value();
                     require(config.resilience.attempt_timeout_ms == 5000, "attempt timeout");
                     require(config.resilience.overall_budget_ms == 20000, "budget with underscores");
                     require(!config.resilience.credential_rotation, "rotation flag");
                     require(config.backoff.base_seconds == 0.5, "backoff base");
                     require(config.backoff.multiplier == 3.0, "backoff multiplier");
                     require(config.backoff.jitter == 0.0, "backoff jitter");
                     require(config.circuit_breaker.failure_threshold == 5, "breaker threshold");
                     require(config.circuit_breaker.recovery_timeout_seconds == 120, "recovery");
                     require(config.cache.ttl_seconds == 600, "cache ttl");
                     require(config.cache.max_entries == 50, "cache capacity");
                     require(config.cache.key_value_prefix_chars == 0, "prefix knob defaults off");
                     require(!config.health.enabled, "health flag");
                     require(config.health.probe_prompt == "ping", "probe prompt");
                     require(config.observability.backend == "none", "backend");
                   }});

  tests.push_back({"config_parse_provider_catalogue", [] {
                     auto parsed = cfg::parse_config(kCatalogue);
                     require(parsed.ok(), parsed.error_message());
                     const auto &providers = parsed.value().providers;
                     require(providers.size() == 2, "two providers expected");

                     const auto &openrouter = providers[0];
                     require(openrouter.name == "openrouter", "first provider name");
                     require(openrouter.api_key_env.size() == 2, "credential list");
                     require(openrouter.requests_per_minute == 20, "provider rpm");
                     require(openrouter.models.size() == 2, "openrouter models");
                     const auto &vision = openrouter.models[0];
                     require(vision.id == "vision-large", "model id");
                     require(vision.context_length == 128000, "context length");
                     require(vision.capabilities[0] == "vision", "capabilities are lower-cased");
                     require(vision.supports_vision, "vision capability sets the flag");
                     require(vision.requests_per_minute.has_value() &&
                                 *vision.requests_per_minute == 5,
                             "model rpm override");
                     require(!vision.requests_per_day.has_value(), "model rpd inherits");
                     require(!openrouter.models[1].supports_vision, "text model has no vision");

                     const auto &groq = providers[1];
                     require(groq.api_key_env.size() == 1 && groq.api_key_env[0] == "GROQ_API_KEY",
                             "scalar api_key_env becomes a one-element list");
                     require(!groq.enabled, "disabled provider");
                     require(groq.models.size() == 1 && groq.models[0].cost_category == "paid",
                             "groq model");
                   }});

  tests.push_back({"config_render_round_trips_catalogue", [] {
                     auto parsed = cfg::parse_config(kCatalogue);
                     require(parsed.ok(), parsed.error_message());
                     auto reparsed = cfg::parse_config(cfg::render_config(parsed.value()));
                     require(reparsed.ok(), reparsed.error_message());
                     const auto &config = reparsed.value();
                     require(config.providers.size() == 2, "providers survive rendering");
                     require(config.providers[0].models.size() == 2, "models survive rendering");
                     require(config.providers[0].models[0].requests_per_minute.value_or(0) == 5,
                             "model limit survives rendering");
                     require(config.circuit_breaker.failure_threshold == 5, "breaker survives");
                   }});

  tests.push_back({"config_validate_accepts_mock", [] {
                     auto result = cfg::validate_config(inferguard::testing::mock_config());
                     require(result.ok(), result.error_message());
                     require(result.value().empty(), "mock config should not warn");
                   }});

  tests.push_back({"config_validate_rejects_empty_catalogue", [] {
                     cfg::Config config;
                     auto result = cfg::validate_config(config);
                     require(!result.ok(), "empty catalogue must fail");
                     require(result.error().find("No providers configured") != std::string::npos,
                             result.error());
                   }});

  tests.push_back({"config_validate_collects_every_problem", [] {
                     auto config = inferguard::testing::mock_config();
                     config.providers.push_back(config.providers[0]);
                     config.providers[1].requests_per_minute = 0;
                     config.backoff.jitter = 1.5;
                     config.circuit_breaker.failure_threshold = 0;
                     config.observability.backend = "log,statsd";
                     auto result = cfg::validate_config(config);
                     require(!result.ok(), "invalid config must fail");
                     const auto &error = result.error();
                     require(error.find("Duplicate provider: alpha") != std::string::npos, error);
                     require(error.find("providers.beta.requests_per_minute must be > 0") !=
                                 std::string::npos,
                             error);
                     require(error.find("backoff.jitter") != std::string::npos, error);
                     require(error.find("circuit_breaker.failure_threshold") != std::string::npos,
                             error);
                     require(error.find("Unknown observability.backend: statsd") != std::string::npos,
                             error);
                     require(error.find("; ") != std::string::npos, "problems joined");
                   }});

  tests.push_back({"config_validate_warns_on_prefix_truncation_and_keyless", [] {
                     auto config = inferguard::testing::mock_config();
                     config.cache.key_value_prefix_chars = 100;
                     config.providers[1].api_key_env.clear();
                     auto result = cfg::validate_config(config);
                     require(result.ok(), result.error_message());
                     bool prefix = false;
                     bool keyless = false;
                     for (const auto &warning : result.value()) {
                       prefix = prefix || warning.find("key_value_prefix_chars") != std::string::npos;
                       keyless = keyless || warning == "providers.beta has no api_key_env credentials";
                     }
                     require(prefix, "prefix truncation warning expected");
                     require(keyless, "keyless warning expected");
                   }});

  tests.push_back({"config_parse_rejects_limits_beyond_32_bits", [] {
                     const std::string toml = R"(
[circuit_breaker]
failure_threshold = 4294967296

[[providers]]
name = "alpha"
base_url = "https://alpha.example.com/v1"
requests_per_minute = 4294967297

[[providers.models]]
id = "alpha-text"
requests_per_day = 4_294_967_296
)";
                     auto result = cfg::parse_config(toml);
                     require(!result.ok(), "wrapping limits must be rejected");
                     const auto &error = result.error();
                     require(error.find("providers.0.requests_per_minute is out of range: 4294967297") !=
                                 std::string::npos,
                             error);
                     require(error.find("providers.0.models.0.requests_per_day is out of range") !=
                                 std::string::npos,
                             error);
                     require(error.find("circuit_breaker.failure_threshold is out of range") !=
                                 std::string::npos,
                             error);

                     auto at_limit = cfg::parse_config(R"(
[[providers]]
name = "alpha"
requests_per_minute = 4294967295
)");
                     require(at_limit.ok(), at_limit.error_message());
                     require(at_limit.value().providers[0].requests_per_minute == 4294967295U,
                             "largest 32-bit value kept");
                   }});

  tests.push_back({"config_validate_bounds_durations", [] {
                     auto config = inferguard::testing::mock_config();
                     config.resilience.attempt_timeout_ms = 18'446'744'073'709'551'615ULL;
                     config.circuit_breaker.recovery_timeout_seconds = 365ULL * 24 * 60 * 60 + 1;
                     config.providers[0].cooldown_seconds = 1ULL << 40;
                     config.backoff.max_seconds = 1e12;
                     auto result = cfg::validate_config(config);
                     require(!result.ok(), "oversized durations must fail");
                     const auto &error = result.error();
                     require(error.find("resilience.attempt_timeout_ms must not exceed") !=
                                 std::string::npos,
                             error);
                     require(error.find("circuit_breaker.recovery_timeout_seconds must not exceed") !=
                                 std::string::npos,
                             error);
                     require(error.find("providers.alpha.cooldown_seconds must not exceed") !=
                                 std::string::npos,
                             error);
                     require(error.find("backoff.max_seconds must not exceed") != std::string::npos,
                             error);

                     auto year = inferguard::testing::mock_config();
                     year.cache.ttl_seconds = 365ULL * 24 * 60 * 60;
                     require(cfg::validate_config(year).ok(), "a year is accepted");
                   }});

  tests.push_back({"config_validate_rejects_catalogue_without_enabled_models", [] {
                     auto config = inferguard::testing::mock_config();
                     for (auto &provider : config.providers) {
                       provider.enabled = false;
                     }
                     auto result = cfg::validate_config(config);
                     require(!result.ok(), "no enabled models must fail");
                     require(result.error().find("No enabled provider exposes a model") !=
                                 std::string::npos,
                             result.error());
                   }});

  tests.push_back({"config_env_overrides", [] {
                     EnvGuard timeout("INFERGUARD_ATTEMPT_TIMEOUT_MS", "1500");
                     EnvGuard budget("INFERGUARD_OVERALL_BUDGET_MS", "9000");
                     EnvGuard cache("INFERGUARD_CACHE_ENABLED", "off");
                     EnvGuard backend("INFERGUARD_OBSERVABILITY", "none");
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.resilience.attempt_timeout_ms == 1500, "timeout override");
                     require(config.resilience.overall_budget_ms == 9000, "budget override");
                     require(!config.cache.enabled, "cache override");
                     require(config.observability.backend == "none", "backend override");
                   }});

  tests.push_back({"config_env_override_ignores_garbage", [] {
                     EnvGuard timeout("INFERGUARD_ATTEMPT_TIMEOUT_MS", "soon");
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.resilience.attempt_timeout_ms == 30000,
                             "unparsable override keeps default");
                   }});

  tests.push_back({"config_path_override_file_and_directory", [] {
                     inferguard::testing::TempWorkspace workspace;
                     {
                       ConfigOverrideGuard guard(workspace.path() / "custom.toml");
                       auto path = cfg::config_path();
                       require(path.ok(), path.error_message());
                       require(path.value() == workspace.path() / "custom.toml", "file override");
                       auto dir = cfg::config_dir();
                       require(dir.ok() && dir.value() == workspace.path(), "dir of file override");
                     }
                     {
                       ConfigOverrideGuard guard(workspace.path());
                       auto path = cfg::config_path();
                       require(path.ok(), path.error_message());
                       require(path.value() == workspace.path() / "config.toml",
                               "directory override appends config.toml");
                     }
                   }});

  tests.push_back({"config_path_from_env", [] {
                     inferguard::testing::TempWorkspace workspace;
                     ConfigOverrideGuard guard;
                     const auto file = workspace.path() / "env.toml";
                     EnvGuard env("INFERGUARD_CONFIG_PATH", file.string());
                     auto path = cfg::config_path();
                     require(path.ok(), path.error_message());
                     require(path.value() == file, "env path should be used");
                   }});

  tests.push_back({"config_load_missing_file_gives_defaults", [] {
                     inferguard::testing::TempWorkspace workspace;
                     ConfigOverrideGuard guard(workspace.path() / "absent.toml");
                     EnvGuard timeout("INFERGUARD_ATTEMPT_TIMEOUT_MS", std::nullopt);
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error_message());
                     require(loaded.value().providers.empty(), "defaults have no providers");
                     require(loaded.value().circuit_breaker.failure_threshold == 3,
                             "default threshold");
                     require(loaded.value().cache.ttl_seconds == 1800, "default ttl");
                     require(loaded.value().health.recheck_interval_seconds == 300,
                             "default recheck interval");
                     require(!cfg::config_exists(), "file should not exist");
                   }});

  tests.push_back({"config_load_from_file_applies_env", [] {
                     inferguard::testing::TempWorkspace workspace;
                     workspace.create_file("config.toml", kCatalogue);
                     ConfigOverrideGuard guard(workspace.path() / "config.toml");
                     EnvGuard timeout("INFERGUARD_ATTEMPT_TIMEOUT_MS", "777");
                     require(cfg::config_exists(), "file should exist");
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error_message());
                     require(loaded.value().providers.size() == 2, "catalogue from file");
                     require(loaded.value().resilience.attempt_timeout_ms == 777,
                             "env beats file");
                   }});
}
