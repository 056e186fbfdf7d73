#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace inferguard::resilience {

enum class ErrorKind {
  RateLimit,
  QuotaExceeded,
  Authentication,
  Authorization,
  NotFound,
  ServerError,
  NetworkError,
  Timeout,
  PaymentRequired,
  InvalidRequest,
  Unknown,
};

enum class Severity { Low, Medium, High, Critical };

struct RecoveryPolicy {
  bool retryable = true;
  std::chrono::seconds backoff_base{0};
  std::chrono::seconds backoff_max{0};
  Severity severity = Severity::Medium;
  bool switch_provider = false;
  bool switch_credential = false;
};

struct Classification {
  ErrorKind kind = ErrorKind::Unknown;
  Severity severity = Severity::Medium;
  RecoveryPolicy policy;
  std::optional<std::uint64_t> retry_after_seconds;
};

[[nodiscard]] std::string_view error_kind_name(ErrorKind kind);
[[nodiscard]] std::string_view severity_name(Severity severity);
[[nodiscard]] std::optional<ErrorKind> parse_error_kind(std::string_view name);

/// Maps raw failure text to the closed ErrorKind taxonomy. Patterns are matched
/// case-insensitively, kinds are tried in declaration order and the first match wins.
class ErrorClassifier {
public:
  ErrorClassifier();

  [[nodiscard]] Classification classify(const std::string &error_text) const;

  [[nodiscard]] static const RecoveryPolicy &policy_for(ErrorKind kind);
  [[nodiscard]] static std::optional<std::uint64_t> extract_retry_after(const std::string &text);

  /// Delay suggested by the kind's policy for the given retry attempt. An explicit
  /// retry-after hint wins. Never less than one second.
  [[nodiscard]] static std::chrono::seconds
  recommended_backoff(ErrorKind kind, std::uint32_t attempt,
                      std::optional<std::uint64_t> retry_after = std::nullopt);

private:
  struct Pattern {
    ErrorKind kind;
    std::regex expression;
  };

  std::vector<Pattern> patterns_;
};

} // namespace inferguard::resilience
