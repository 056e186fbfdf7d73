#pragma once

#include "inferguard/providers/traits.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace inferguard::providers {

/// Client for any endpoint speaking the OpenAI chat-completions shape.
class CompatibleProvider : public Provider {
public:
  CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                     std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>(),
                     bool require_api_key = true,
                     std::unordered_map<std::string, std::string> extra_headers = {});

  [[nodiscard]] common::Result<std::string> complete(const InferenceRequest &request) override;

  [[nodiscard]] common::Status warmup() override;
  [[nodiscard]] std::string name() const override;

  [[nodiscard]] std::string build_body(const InferenceRequest &request) const;

private:
  [[nodiscard]] common::Result<std::string> handle_response(const HttpResponse &response) const;
  [[nodiscard]] common::Status validate_response_status(const HttpResponse &response) const;
  [[nodiscard]] std::unordered_map<std::string, std::string> request_headers() const;

  std::string name_;
  std::string base_url_;
  std::string api_key_;
  std::shared_ptr<HttpClient> http_client_;
  bool require_api_key_ = true;
  std::unordered_map<std::string, std::string> extra_headers_;
};

} // namespace inferguard::providers
