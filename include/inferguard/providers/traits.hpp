#pragma once

#include "inferguard/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace inferguard::providers {

enum class ProviderErrorCode {
  ApiError,
  NetworkError,
  AuthError,
  Forbidden,
  PaymentRequired,
  RateLimitError,
  ModelNotFound,
  InvalidResponse,
  Timeout,
};

/// Rendered into the error string a client returns. The wording is chosen so the
/// resilience layer's classifier recognizes each code.
struct ProviderError {
  ProviderErrorCode code = ProviderErrorCode::ApiError;
  std::uint16_t status = 0;
  std::string message;
  std::optional<std::uint64_t> retry_after;

  [[nodiscard]] std::string to_string() const;
};

/// One completion call: a prompt, an optional inline image and the target model.
struct InferenceRequest {
  std::string prompt;
  std::optional<std::string> system_prompt;
  std::optional<std::string> image_base64;
  std::string image_mime_type = "image/png";
  std::string model;
  double temperature = 0.7;
  std::optional<std::uint32_t> max_tokens;
  std::chrono::milliseconds timeout{30'000};
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse
  get(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
      std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse get(const std::string &url,
                                 const std::unordered_map<std::string, std::string> &headers,
                                 std::uint64_t timeout_ms) override;
};

/// Upstream model client: given a prompt, optional image and model, returns generated
/// text or an error string. Implementations must be safe to call from several threads.
class Provider {
public:
  virtual ~Provider() = default;

  [[nodiscard]] virtual common::Result<std::string> complete(const InferenceRequest &request) = 0;

  [[nodiscard]] virtual common::Status warmup() = 0;
  [[nodiscard]] virtual std::string name() const = 0;
};

[[nodiscard]] common::Result<std::string> parse_openai_content(const std::string &response);
/// Pulls `error.message` out of a JSON error body, or returns the body cut to a
/// readable length.
[[nodiscard]] std::string summarize_error_body(const std::string &body);

} // namespace inferguard::providers
