#include "inferguard/providers/factory.hpp"

#include "inferguard/common/fs.hpp"
#include "inferguard/providers/compatible.hpp"

#include <cctype>
#include <cstdlib>

namespace inferguard::providers {

namespace {

struct CompatibleRoute {
  CompatibleRoute() = default;
  CompatibleRoute(std::string base, const bool require_key)
      : base_url(std::move(base)), require_api_key(require_key) {}

  std::string base_url;
  bool require_api_key = true;
};

const std::unordered_map<std::string, CompatibleRoute> &compatible_routes() {
  static const std::unordered_map<std::string, CompatibleRoute> routes = {
      {"openai", {"https://api.openai.com/v1", true}},
      {"openrouter", {"https://openrouter.ai/api/v1", true}},
      {"groq", {"https://api.groq.com/openai/v1", true}},
      {"together", {"https://api.together.xyz/v1", true}},
      {"google", {"https://generativelanguage.googleapis.com/v1beta/openai", true}},
      {"gemini", {"https://generativelanguage.googleapis.com/v1beta/openai", true}},
      {"huggingface", {"https://router.huggingface.co/v1", true}},
      {"mistral", {"https://api.mistral.ai/v1", true}},
      {"deepseek", {"https://api.deepseek.com/v1", true}},
      {"cerebras", {"https://api.cerebras.ai/v1", true}},
      {"fireworks", {"https://api.fireworks.ai/inference/v1", true}},
      {"nvidia", {"https://integrate.api.nvidia.com/v1", true}},
      {"ollama", {"http://localhost:11434/v1", false}},
      {"vllm", {"http://127.0.0.1:8000/v1", false}},
      {"litellm", {"http://localhost:4000", false}},
  };
  return routes;
}

std::optional<std::string> read_env(const std::string &name) {
  if (name.empty()) {
    return std::nullopt;
  }
  const char *value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  const std::string trimmed = common::trim(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

std::string provider_env_prefix(const std::string &provider) {
  std::string prefix;
  prefix.reserve(provider.size());
  for (const char ch : provider) {
    if (std::isalnum(static_cast<unsigned char>(ch)) != 0) {
      prefix.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
      continue;
    }
    prefix.push_back('_');
  }
  return prefix;
}

} // namespace

std::optional<std::string> default_base_url(const std::string &provider) {
  const auto &routes = compatible_routes();
  const auto it = routes.find(common::to_lower(common::trim(provider)));
  if (it == routes.end()) {
    return std::nullopt;
  }
  return it->second.base_url;
}

std::string resolve_base_url(const registry::ProviderEntry &provider) {
  const std::string prefix = provider_env_prefix(provider.name);
  if (const auto local = read_env(prefix + "_BASE_URL"); local.has_value()) {
    return *local;
  }
  if (const auto global = read_env("INFERGUARD_" + prefix + "_BASE_URL"); global.has_value()) {
    return *global;
  }
  if (!provider.base_url.empty()) {
    return provider.base_url;
  }
  return default_base_url(provider.name).value_or("");
}

common::Result<CredentialClients>
create_provider_clients(const registry::ProviderEntry &provider,
                        std::shared_ptr<HttpClient> http_client) {
  const std::string base_url = resolve_base_url(provider);
  if (base_url.empty()) {
    return common::Result<CredentialClients>::failure("no base_url for provider: " +
                                                      provider.name);
  }

  CredentialClients clients;
  if (provider.api_key_env.empty()) {
    // Keyless endpoint, typically a local server.
    clients.push_back(
        std::make_shared<CompatibleProvider>(provider.name, base_url, "", http_client, false));
    return common::Result<CredentialClients>::success(std::move(clients));
  }

  for (const auto &env_name : provider.api_key_env) {
    clients.push_back(std::make_shared<CompatibleProvider>(
        provider.name, base_url, read_env(env_name).value_or(""), http_client, true));
  }
  return common::Result<CredentialClients>::success(std::move(clients));
}

common::Result<ClientTable> create_clients(const registry::ModelRegistry &registry,
                                           std::shared_ptr<HttpClient> http_client) {
  ClientTable table;
  for (const auto &provider : registry.providers()) {
    auto clients = create_provider_clients(provider, http_client);
    if (!clients.ok()) {
      return common::Result<ClientTable>::failure(clients.error());
    }
    table.emplace(provider.name, std::move(clients.value()));
  }
  return common::Result<ClientTable>::success(std::move(table));
}

} // namespace inferguard::providers
