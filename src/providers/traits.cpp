#include "inferguard/providers/traits.hpp"

#include "inferguard/common/fs.hpp"
#include "inferguard/common/json_util.hpp"

#include <curl/curl.h>

#include <sstream>

namespace inferguard::providers {

namespace {

constexpr std::size_t kMaxErrorBodyChars = 512;

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<std::unordered_map<std::string, std::string> *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    const std::string value = common::trim(header.substr(separator + 1));
    (*headers)[key] = value;
  }

  return total;
}

HttpResponse execute_request(const std::string &url,
                             const std::unordered_map<std::string, std::string> &headers,
                             const std::optional<std::string> &body,
                             const std::uint64_t timeout_ms) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "inferguard/0.1");

  if (body.has_value()) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
  }

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);

  return response;
}

} // namespace

std::string ProviderError::to_string() const {
  std::ostringstream stream;
  switch (code) {
  case ProviderErrorCode::ApiError:
    stream << "api error";
    break;
  case ProviderErrorCode::NetworkError:
    stream << "network error";
    break;
  case ProviderErrorCode::AuthError:
    stream << "authentication failed";
    break;
  case ProviderErrorCode::Forbidden:
    stream << "forbidden";
    break;
  case ProviderErrorCode::PaymentRequired:
    stream << "payment required";
    break;
  case ProviderErrorCode::RateLimitError:
    stream << "rate limit";
    break;
  case ProviderErrorCode::ModelNotFound:
    stream << "model not found";
    break;
  case ProviderErrorCode::InvalidResponse:
    stream << "invalid response";
    break;
  case ProviderErrorCode::Timeout:
    stream << "request timed out";
    break;
  }
  if (status != 0) {
    stream << " status=" << status;
  }
  if (retry_after.has_value()) {
    stream << " retry_after=" << *retry_after;
  }
  if (!message.empty()) {
    stream << ": " << message;
  }
  return stream.str();
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post_json(
    const std::string &url, const std::unordered_map<std::string, std::string> &headers,
    const std::string &body, const std::uint64_t timeout_ms) {
  return execute_request(url, headers, body, timeout_ms);
}

HttpResponse CurlHttpClient::get(const std::string &url,
                                 const std::unordered_map<std::string, std::string> &headers,
                                 const std::uint64_t timeout_ms) {
  return execute_request(url, headers, std::nullopt, timeout_ms);
}

common::Result<std::string> parse_openai_content(const std::string &response) {
  const std::string choices = common::json_get_array(response, "choices");
  if (choices.empty()) {
    return common::Result<std::string>::failure("choices field missing");
  }

  const std::string message = common::json_get_object(choices, "message");
  if (message.empty()) {
    return common::Result<std::string>::failure("choices[0].message missing");
  }

  const bool has_empty_content = message.find("\"content\":\"\"") != std::string::npos ||
                                 message.find("\"content\": \"\"") != std::string::npos;
  const std::string content = common::json_get_string(message, "content");
  if (content.empty() && !has_empty_content) {
    return common::Result<std::string>::failure("choices[0].message.content missing");
  }
  return common::Result<std::string>::success(content);
}

std::string summarize_error_body(const std::string &body) {
  const std::string error = common::json_get_object(body, "error");
  if (!error.empty()) {
    const std::string message = common::json_get_string(error, "message");
    if (!message.empty()) {
      return message;
    }
  }
  if (const std::string message = common::json_get_string(body, "error"); !message.empty()) {
    return message;
  }
  std::string trimmed = common::trim(body);
  if (trimmed.size() > kMaxErrorBodyChars) {
    trimmed.resize(kMaxErrorBodyChars);
    trimmed += "...";
  }
  return trimmed;
}

} // namespace inferguard::providers
