#pragma once

#include "inferguard/common/result.hpp"
#include "inferguard/providers/traits.hpp"
#include "inferguard/registry/model_registry.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace inferguard::providers {

/// Clients of one provider, indexed like its `api_key_env` list.
using CredentialClients = std::vector<std::shared_ptr<Provider>>;
using ClientTable = std::unordered_map<std::string, CredentialClients>;

/// Built-in endpoint for well-known provider ids, used when the catalogue leaves
/// `base_url` empty.
[[nodiscard]] std::optional<std::string> default_base_url(const std::string &provider);

/// `<NAME>_BASE_URL`, then `INFERGUARD_<NAME>_BASE_URL`, then the catalogue value.
[[nodiscard]] std::string resolve_base_url(const registry::ProviderEntry &provider);

/// One client per credential. A credential whose variable is unset still gets a client;
/// it fails with an authentication error and is rotated out like a revoked key.
[[nodiscard]] common::Result<CredentialClients>
create_provider_clients(const registry::ProviderEntry &provider,
                        std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

[[nodiscard]] common::Result<ClientTable>
create_clients(const registry::ModelRegistry &registry,
               std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

} // namespace inferguard::providers
