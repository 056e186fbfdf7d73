#include "inferguard/providers/compatible.hpp"

#include "inferguard/common/fs.hpp"
#include "inferguard/common/json_util.hpp"

#include <algorithm>
#include <sstream>

namespace inferguard::providers {

namespace {

common::Result<std::string> provider_error_result(const ProviderError &error) {
  return common::Result<std::string>::failure(error.to_string());
}

std::optional<std::uint64_t> parse_retry_after(const HttpResponse &response) {
  const auto it = response.headers.find("retry-after");
  if (it == response.headers.end()) {
    return std::nullopt;
  }
  try {
    return static_cast<std::uint64_t>(std::stoull(common::trim(it->second)));
  } catch (const std::exception &) {
    // HTTP-date form; the classifier falls back to its own reset window.
    return std::nullopt;
  }
}

} // namespace

CompatibleProvider::CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                                       std::shared_ptr<HttpClient> http_client,
                                       const bool require_api_key,
                                       std::unordered_map<std::string, std::string> extra_headers)
    : name_(std::move(name)), base_url_(std::move(base_url)), api_key_(std::move(api_key)),
      http_client_(std::move(http_client)), require_api_key_(require_api_key),
      extra_headers_(std::move(extra_headers)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string CompatibleProvider::build_body(const InferenceRequest &request) const {
  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(request.model) << "\",";
  body << "\"messages\":[";
  if (request.system_prompt.has_value()) {
    body << "{\"role\":\"system\",\"content\":\"" << common::json_escape(*request.system_prompt)
         << "\"},";
  }
  body << "{\"role\":\"user\",\"content\":";
  if (request.image_base64.has_value()) {
    body << "[{\"type\":\"text\",\"text\":\"" << common::json_escape(request.prompt) << "\"},";
    body << "{\"type\":\"image_url\",\"image_url\":{\"url\":\"data:"
         << common::json_escape(request.image_mime_type) << ";base64,"
         << common::json_escape(*request.image_base64) << "\"}}]";
  } else {
    body << "\"" << common::json_escape(request.prompt) << "\"";
  }
  body << "}],";
  if (request.max_tokens.has_value()) {
    body << "\"max_tokens\":" << *request.max_tokens << ",";
  }
  body << "\"temperature\":" << request.temperature << ",";
  body << "\"stream\":false";
  body << "}";
  return body.str();
}

common::Status CompatibleProvider::validate_response_status(const HttpResponse &response) const {
  if (response.timeout) {
    return common::Status::error(
        ProviderError{.code = ProviderErrorCode::Timeout, .message = response.network_error_message}
            .to_string());
  }

  if (response.network_error) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::NetworkError,
                                               .message = response.network_error_message}
                                     .to_string());
  }

  if (response.status >= 200 && response.status < 300) {
    return common::Status::success();
  }

  ProviderError error{.status = response.status, .message = summarize_error_body(response.body)};
  switch (response.status) {
  case 401:
    error.code = ProviderErrorCode::AuthError;
    break;
  case 402:
    error.code = ProviderErrorCode::PaymentRequired;
    break;
  case 403:
    error.code = ProviderErrorCode::Forbidden;
    break;
  case 404:
    error.code = ProviderErrorCode::ModelNotFound;
    break;
  case 429:
    error.code = ProviderErrorCode::RateLimitError;
    error.retry_after = parse_retry_after(response);
    break;
  default:
    error.code = ProviderErrorCode::ApiError;
    if (response.status == 503) {
      error.retry_after = parse_retry_after(response);
    }
    break;
  }
  return common::Status::error(error.to_string());
}

common::Result<std::string> CompatibleProvider::handle_response(const HttpResponse &response) const {
  auto status = validate_response_status(response);
  if (!status.ok()) {
    return common::Result<std::string>::failure(status.error());
  }

  const auto parsed = parse_openai_content(response.body);
  if (!parsed.ok()) {
    return provider_error_result(
        {.code = ProviderErrorCode::InvalidResponse, .message = parsed.error()});
  }
  return parsed;
}

std::unordered_map<std::string, std::string> CompatibleProvider::request_headers() const {
  std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
  };
  if (!api_key_.empty()) {
    headers["Authorization"] = "Bearer " + api_key_;
  }
  for (const auto &[key, value] : extra_headers_) {
    headers[key] = value;
  }
  return headers;
}

common::Result<std::string> CompatibleProvider::complete(const InferenceRequest &request) {
  if (require_api_key_ && api_key_.empty()) {
    return provider_error_result(
        {.code = ProviderErrorCode::AuthError, .message = "missing API key"});
  }

  const std::string body = build_body(request);
  const auto timeout_ms = static_cast<std::uint64_t>(std::max<std::int64_t>(1, request.timeout.count()));
  const auto response =
      http_client_->post_json(base_url_ + "/chat/completions", request_headers(), body, timeout_ms);
  return handle_response(response);
}

common::Status CompatibleProvider::warmup() {
  if (require_api_key_ && api_key_.empty()) {
    return common::Status::error(
        ProviderError{.code = ProviderErrorCode::AuthError, .message = "missing API key"}.to_string());
  }
  const auto response = http_client_->get(base_url_ + "/models", request_headers(), 5'000);
  if (response.network_error || response.timeout) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::NetworkError,
                                               .message = response.network_error_message}
                                     .to_string());
  }
  return common::Status::success();
}

std::string CompatibleProvider::name() const { return name_; }

} // namespace inferguard::providers
