#include "inferguard/config/config.hpp"

#include "inferguard/common/fs.hpp"
#include "inferguard/common/toml.hpp"

#include <cstdlib>
#include <filesystem>
#include <limits>
#include <set>
#include <sstream>

namespace inferguard::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".inferguard";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("INFERGUARD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

// Durations are carried as std::chrono values added to clock readings; a year keeps
// every sum far from overflow.
constexpr std::uint64_t MAX_DURATION_SECONDS = 365ULL * 24 * 60 * 60;

std::uint32_t get_u32(const common::TomlDocument &doc, const std::string &key,
                      const std::uint32_t fallback, std::vector<std::string> &errors) {
  const std::uint64_t value = doc.get_u64(key, fallback);
  if (value > std::numeric_limits<std::uint32_t>::max()) {
    errors.push_back(key + " is out of range: " + std::to_string(value));
    return fallback;
  }
  return static_cast<std::uint32_t>(value);
}

ModelConfig load_model(const common::TomlDocument &doc, const std::string &prefix,
                       std::vector<std::string> &errors) {
  ModelConfig model;
  model.id = doc.get_string(prefix + "id");
  model.context_length = doc.get_u64(prefix + "context_length", model.context_length);
  model.capabilities = doc.get_string_array(prefix + "capabilities");
  for (auto &capability : model.capabilities) {
    capability = common::to_lower(common::trim(capability));
  }
  if (doc.has(prefix + "requests_per_minute")) {
    model.requests_per_minute = get_u32(doc, prefix + "requests_per_minute", 0, errors);
  }
  if (doc.has(prefix + "requests_per_day")) {
    model.requests_per_day = get_u32(doc, prefix + "requests_per_day", 0, errors);
  }
  model.priority = get_u32(doc, prefix + "priority", model.priority, errors);
  model.supports_vision = doc.get_bool(prefix + "supports_vision", model.supports_vision);
  // A "vision" capability and the flag describe the same thing.
  for (const auto &capability : model.capabilities) {
    if (capability == "vision") {
      model.supports_vision = true;
    }
  }
  model.cost_category = doc.get_string(prefix + "cost_category", model.cost_category);
  return model;
}

ProviderConfig load_provider(const common::TomlDocument &doc, const std::size_t index,
                             std::vector<std::string> &errors) {
  const std::string prefix = "providers." + std::to_string(index) + ".";
  ProviderConfig provider;
  provider.name = common::trim(doc.get_string(prefix + "name"));
  provider.base_url = expand_config_value(doc.get_string(prefix + "base_url"));
  provider.api_key_env = doc.get_string_array(prefix + "api_key_env");
  if (provider.api_key_env.empty() && doc.has(prefix + "api_key_env")) {
    provider.api_key_env.push_back(doc.get_string(prefix + "api_key_env"));
  }
  provider.requests_per_minute =
      get_u32(doc, prefix + "requests_per_minute", provider.requests_per_minute, errors);
  provider.requests_per_day =
      get_u32(doc, prefix + "requests_per_day", provider.requests_per_day, errors);
  provider.burst_limit = get_u32(doc, prefix + "burst_limit", provider.burst_limit, errors);
  provider.cooldown_seconds = doc.get_u64(prefix + "cooldown_seconds", provider.cooldown_seconds);
  provider.priority = get_u32(doc, prefix + "priority", provider.priority, errors);
  provider.enabled = doc.get_bool(prefix + "enabled", provider.enabled);

  const std::size_t model_count = doc.table_array_size(prefix + "models");
  for (std::size_t model_index = 0; model_index < model_count; ++model_index) {
    provider.models.push_back(
        load_model(doc, prefix + "models." + std::to_string(model_index) + ".", errors));
  }
  return provider;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

std::optional<std::uint64_t> env_u64(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  try {
    return static_cast<std::uint64_t>(std::stoull(common::trim(raw)));
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    return common::Result<std::filesystem::path>::success(override_path->parent_path());
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const auto timeout = env_u64("INFERGUARD_ATTEMPT_TIMEOUT_MS"); timeout.has_value()) {
    config.resilience.attempt_timeout_ms = *timeout;
  }
  if (const auto budget = env_u64("INFERGUARD_OVERALL_BUDGET_MS"); budget.has_value()) {
    config.resilience.overall_budget_ms = *budget;
  }
  if (const char *cache = std::getenv("INFERGUARD_CACHE_ENABLED"); cache != nullptr && *cache) {
    const std::string value = common::to_lower(common::trim(cache));
    config.cache.enabled = value == "1" || value == "true" || value == "yes" || value == "on";
  }
  if (const char *backend = std::getenv("INFERGUARD_OBSERVABILITY");
      backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();
  Config config;
  std::vector<std::string> errors;

  auto &resilience = config.resilience;
  resilience.attempt_timeout_ms =
      doc.get_u64("resilience.attempt_timeout_ms", resilience.attempt_timeout_ms);
  resilience.overall_budget_ms =
      doc.get_u64("resilience.overall_budget_ms", resilience.overall_budget_ms);
  resilience.retry_after_unattempted_seconds = doc.get_u64(
      "resilience.retry_after_unattempted_seconds", resilience.retry_after_unattempted_seconds);
  resilience.retry_after_exhausted_seconds = doc.get_u64(
      "resilience.retry_after_exhausted_seconds", resilience.retry_after_exhausted_seconds);
  resilience.credential_rotation =
      doc.get_bool("resilience.credential_rotation", resilience.credential_rotation);

  config.backoff.base_seconds = doc.get_double("backoff.base_seconds", config.backoff.base_seconds);
  config.backoff.multiplier = doc.get_double("backoff.multiplier", config.backoff.multiplier);
  config.backoff.max_seconds = doc.get_double("backoff.max_seconds", config.backoff.max_seconds);
  config.backoff.jitter = doc.get_double("backoff.jitter", config.backoff.jitter);

  config.circuit_breaker.failure_threshold = get_u32(
      doc, "circuit_breaker.failure_threshold", config.circuit_breaker.failure_threshold, errors);
  config.circuit_breaker.recovery_timeout_seconds =
      doc.get_u64("circuit_breaker.recovery_timeout_seconds",
                  config.circuit_breaker.recovery_timeout_seconds);

  config.cache.enabled = doc.get_bool("cache.enabled", config.cache.enabled);
  config.cache.ttl_seconds = doc.get_u64("cache.ttl_seconds", config.cache.ttl_seconds);
  config.cache.max_entries = doc.get_u64("cache.max_entries", config.cache.max_entries);
  config.cache.key_value_prefix_chars =
      doc.get_u64("cache.key_value_prefix_chars", config.cache.key_value_prefix_chars);

  auto &health = config.health;
  health.enabled = doc.get_bool("health.enabled", health.enabled);
  health.poll_interval_seconds =
      doc.get_u64("health.poll_interval_seconds", health.poll_interval_seconds);
  health.recheck_interval_seconds =
      doc.get_u64("health.recheck_interval_seconds", health.recheck_interval_seconds);
  health.failure_threshold =
      get_u32(doc, "health.failure_threshold", health.failure_threshold, errors);
  health.probe_timeout_seconds =
      doc.get_u64("health.probe_timeout_seconds", health.probe_timeout_seconds);
  health.probe_prompt = doc.get_string("health.probe_prompt", health.probe_prompt);

  config.errors.history_size = doc.get_u64("errors.history_size", config.errors.history_size);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.log_level =
      doc.get_string("observability.log_level", config.observability.log_level);

  const std::size_t provider_count = doc.table_array_size("providers");
  for (std::size_t index = 0; index < provider_count; ++index) {
    config.providers.push_back(load_provider(doc, index, errors));
  }

  if (!errors.empty()) {
    std::string joined;
    for (const auto &error : errors) {
      if (!joined.empty()) {
        joined += "; ";
      }
      joined += error;
    }
    return common::Result<Config>::failure(joined);
  }
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }
  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[resilience]\n";
  out << "attempt_timeout_ms = " << config.resilience.attempt_timeout_ms << "\n";
  out << "overall_budget_ms = " << config.resilience.overall_budget_ms << "\n";
  out << "retry_after_unattempted_seconds = " << config.resilience.retry_after_unattempted_seconds
      << "\n";
  out << "retry_after_exhausted_seconds = " << config.resilience.retry_after_exhausted_seconds
      << "\n";
  out << "credential_rotation = " << bool_to_toml(config.resilience.credential_rotation) << "\n\n";

  out << "[backoff]\n";
  out << "base_seconds = " << config.backoff.base_seconds << "\n";
  out << "multiplier = " << config.backoff.multiplier << "\n";
  out << "max_seconds = " << config.backoff.max_seconds << "\n";
  out << "jitter = " << config.backoff.jitter << "\n\n";

  out << "[circuit_breaker]\n";
  out << "failure_threshold = " << config.circuit_breaker.failure_threshold << "\n";
  out << "recovery_timeout_seconds = " << config.circuit_breaker.recovery_timeout_seconds
      << "\n\n";

  out << "[cache]\n";
  out << "enabled = " << bool_to_toml(config.cache.enabled) << "\n";
  out << "ttl_seconds = " << config.cache.ttl_seconds << "\n";
  out << "max_entries = " << config.cache.max_entries << "\n";
  out << "key_value_prefix_chars = " << config.cache.key_value_prefix_chars << "\n\n";

  out << "[health]\n";
  out << "enabled = " << bool_to_toml(config.health.enabled) << "\n";
  out << "poll_interval_seconds = " << config.health.poll_interval_seconds << "\n";
  out << "recheck_interval_seconds = " << config.health.recheck_interval_seconds << "\n";
  out << "failure_threshold = " << config.health.failure_threshold << "\n";
  out << "probe_timeout_seconds = " << config.health.probe_timeout_seconds << "\n";
  out << "probe_prompt = " << common::quote_toml_string(config.health.probe_prompt) << "\n\n";

  out << "[errors]\n";
  out << "history_size = " << config.errors.history_size << "\n\n";

  out << "[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "log_level = " << common::quote_toml_string(config.observability.log_level) << "\n";

  for (const auto &provider : config.providers) {
    out << "\n[[providers]]\n";
    out << "name = " << common::quote_toml_string(provider.name) << "\n";
    out << "base_url = " << common::quote_toml_string(provider.base_url) << "\n";
    out << "api_key_env = " << string_array_to_toml(provider.api_key_env) << "\n";
    out << "requests_per_minute = " << provider.requests_per_minute << "\n";
    out << "requests_per_day = " << provider.requests_per_day << "\n";
    out << "burst_limit = " << provider.burst_limit << "\n";
    out << "cooldown_seconds = " << provider.cooldown_seconds << "\n";
    out << "priority = " << provider.priority << "\n";
    out << "enabled = " << bool_to_toml(provider.enabled) << "\n";
    for (const auto &model : provider.models) {
      out << "\n[[providers.models]]\n";
      out << "id = " << common::quote_toml_string(model.id) << "\n";
      out << "context_length = " << model.context_length << "\n";
      out << "capabilities = " << string_array_to_toml(model.capabilities) << "\n";
      if (model.requests_per_minute.has_value()) {
        out << "requests_per_minute = " << *model.requests_per_minute << "\n";
      }
      if (model.requests_per_day.has_value()) {
        out << "requests_per_day = " << *model.requests_per_day << "\n";
      }
      out << "priority = " << model.priority << "\n";
      out << "supports_vision = " << bool_to_toml(model.supports_vision) << "\n";
      out << "cost_category = " << common::quote_toml_string(model.cost_category) << "\n";
    }
  }
  return out.str();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> problems;
  std::vector<std::string> warnings;

  const auto bound_seconds = [&](const std::string &key, const std::uint64_t value) {
    if (value > MAX_DURATION_SECONDS) {
      problems.push_back(key + " must not exceed " + std::to_string(MAX_DURATION_SECONDS) +
                         " seconds");
    }
  };
  const auto bound_millis = [&](const std::string &key, const std::uint64_t value) {
    if (value > MAX_DURATION_SECONDS * 1000) {
      problems.push_back(key + " must not exceed " + std::to_string(MAX_DURATION_SECONDS * 1000) +
                         " milliseconds");
    }
  };
  bound_millis("resilience.attempt_timeout_ms", config.resilience.attempt_timeout_ms);
  bound_millis("resilience.overall_budget_ms", config.resilience.overall_budget_ms);
  bound_seconds("resilience.retry_after_unattempted_seconds",
                config.resilience.retry_after_unattempted_seconds);
  bound_seconds("resilience.retry_after_exhausted_seconds",
                config.resilience.retry_after_exhausted_seconds);
  bound_seconds("circuit_breaker.recovery_timeout_seconds",
                config.circuit_breaker.recovery_timeout_seconds);
  bound_seconds("cache.ttl_seconds", config.cache.ttl_seconds);
  bound_seconds("health.poll_interval_seconds", config.health.poll_interval_seconds);
  bound_seconds("health.recheck_interval_seconds", config.health.recheck_interval_seconds);
  bound_seconds("health.probe_timeout_seconds", config.health.probe_timeout_seconds);
  if (config.backoff.max_seconds > static_cast<double>(MAX_DURATION_SECONDS)) {
    problems.push_back("backoff.max_seconds must not exceed " +
                       std::to_string(MAX_DURATION_SECONDS) + " seconds");
  }

  if (config.resilience.attempt_timeout_ms == 0) {
    problems.emplace_back("resilience.attempt_timeout_ms must be greater than 0");
  }
  if (config.resilience.overall_budget_ms != 0 &&
      config.resilience.overall_budget_ms < config.resilience.attempt_timeout_ms) {
    warnings.emplace_back("resilience.overall_budget_ms is shorter than a single attempt timeout");
  }

  if (config.backoff.base_seconds <= 0.0) {
    problems.emplace_back("backoff.base_seconds must be greater than 0");
  }
  if (config.backoff.multiplier < 1.0) {
    problems.emplace_back("backoff.multiplier must be at least 1.0");
  }
  if (config.backoff.max_seconds < config.backoff.base_seconds) {
    problems.emplace_back("backoff.max_seconds must not be smaller than backoff.base_seconds");
  }
  if (config.backoff.jitter < 0.0 || config.backoff.jitter > 1.0) {
    problems.emplace_back("backoff.jitter must be between 0.0 and 1.0");
  }

  if (config.circuit_breaker.failure_threshold == 0) {
    problems.emplace_back("circuit_breaker.failure_threshold must be greater than 0");
  }
  if (config.circuit_breaker.recovery_timeout_seconds == 0) {
    problems.emplace_back("circuit_breaker.recovery_timeout_seconds must be greater than 0");
  }

  if (config.cache.enabled) {
    if (config.cache.ttl_seconds == 0) {
      problems.emplace_back("cache.ttl_seconds must be greater than 0");
    }
    if (config.cache.max_entries == 0) {
      problems.emplace_back("cache.max_entries must be greater than 0");
    }
    if (config.cache.key_value_prefix_chars != 0) {
      warnings.emplace_back("cache.key_value_prefix_chars truncates parameters before hashing; "
                            "distinct requests sharing a prefix will share a cache entry");
    }
  }

  if (config.health.enabled) {
    if (config.health.poll_interval_seconds == 0) {
      problems.emplace_back("health.poll_interval_seconds must be greater than 0");
    }
    if (config.health.failure_threshold == 0) {
      problems.emplace_back("health.failure_threshold must be greater than 0");
    }
    if (config.health.probe_timeout_seconds == 0) {
      problems.emplace_back("health.probe_timeout_seconds must be greater than 0");
    }
  }

  if (config.errors.history_size == 0) {
    problems.emplace_back("errors.history_size must be greater than 0");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  for (const auto &part : common::split(backend, ',')) {
    if (part != "log" && part != "none" && part != "noop") {
      problems.emplace_back("Unknown observability.backend: " + part);
    }
  }

  if (config.providers.empty()) {
    problems.emplace_back("No providers configured");
  }

  std::set<std::string> provider_names;
  std::size_t enabled_models = 0;
  for (const auto &provider : config.providers) {
    if (provider.name.empty()) {
      problems.emplace_back("Provider entry without a name");
      continue;
    }
    if (!provider_names.insert(provider.name).second) {
      problems.emplace_back("Duplicate provider: " + provider.name);
    }
    bound_seconds("providers." + provider.name + ".cooldown_seconds", provider.cooldown_seconds);
    if (provider.requests_per_minute == 0) {
      problems.emplace_back("providers." + provider.name + ".requests_per_minute must be > 0");
    }
    if (provider.requests_per_day == 0) {
      problems.emplace_back("providers." + provider.name + ".requests_per_day must be > 0");
    }
    if (provider.requests_per_day < provider.requests_per_minute) {
      warnings.push_back("providers." + provider.name +
                         ".requests_per_day is lower than requests_per_minute");
    }
    if (provider.api_key_env.empty()) {
      warnings.push_back("providers." + provider.name + " has no api_key_env credentials");
    }
    if (provider.models.empty()) {
      warnings.push_back("providers." + provider.name + " has no models");
    }

    std::set<std::string> model_ids;
    for (const auto &model : provider.models) {
      const std::string label = provider.name + "/" + model.id;
      if (model.id.empty()) {
        problems.push_back("Model without an id under provider " + provider.name);
        continue;
      }
      if (!model_ids.insert(model.id).second) {
        problems.push_back("Duplicate model: " + label);
      }
      if (model.requests_per_minute.has_value() && *model.requests_per_minute == 0) {
        problems.push_back(label + ".requests_per_minute must be > 0");
      }
      if (model.requests_per_day.has_value() && *model.requests_per_day == 0) {
        problems.push_back(label + ".requests_per_day must be > 0");
      }
      if (model.context_length == 0) {
        problems.push_back(label + ".context_length must be > 0");
      }
      if (provider.enabled) {
        ++enabled_models;
      }
    }
  }
  if (!config.providers.empty() && enabled_models == 0) {
    problems.emplace_back("No enabled provider exposes a model");
  }

  if (!problems.empty()) {
    std::string joined;
    for (const auto &problem : problems) {
      if (!joined.empty()) {
        joined += "; ";
      }
      joined += problem;
    }
    return common::Result<std::vector<std::string>>::failure(joined);
  }
  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace inferguard::config
