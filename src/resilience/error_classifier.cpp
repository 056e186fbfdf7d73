#include "inferguard/resilience/error_classifier.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

namespace inferguard::resilience {

namespace {

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

// Status codes are bounded so "1500ms" does not read as a 500.
const std::vector<std::pair<ErrorKind, std::vector<const char *>>> &pattern_table() {
  static const std::vector<std::pair<ErrorKind, std::vector<const char *>>> table = {
      {ErrorKind::RateLimit,
       {R"(\b429\b)", "rate.?limit", "too.?many.?requests", "requests.?per.?minute",
        "requests.?per.?second", "throttle", "rate.?exceeded"}},
      {ErrorKind::QuotaExceeded,
       {"quota.?exceeded", "quota.?exhausted", "usage.?limit", "daily.?limit", "monthly.?limit",
        "resource.?exhausted", "limit.?reached", "credits.?exhausted"}},
      {ErrorKind::Authentication,
       {R"(\b401\b)", "unauthorized", "invalid.?api.?key", "authentication.?failed",
        "api.?key.?not.?found", "invalid.?credentials"}},
      {ErrorKind::Authorization,
       {R"(\b403\b)", "forbidden", "access.?denied", "insufficient.?permissions",
        "not.?authorized"}},
      {ErrorKind::NotFound,
       {R"(\b404\b)", "not.?found", "model.?not.?found", "endpoint.?not.?found",
        "resource.?not.?found"}},
      {ErrorKind::ServerError,
       {R"(\b500\b)", R"(\b502\b)", R"(\b503\b)", R"(\b504\b)", "internal.?server.?error",
        "bad.?gateway", "service.?unavailable", "gateway.?timeout", "server.?error"}},
      {ErrorKind::NetworkError,
       {"connection.?error", "network.?error", "dns.?error", "connection.?refused",
        "connection.?timeout", "network.?unreachable"}},
      {ErrorKind::Timeout,
       {"timeout", "timed.?out", "request.?timeout", "read.?timeout", "connect.?timeout"}},
      {ErrorKind::PaymentRequired,
       {R"(\b402\b)", "payment.?required", "insufficient.?funds", "billing.?error",
        "subscription.?expired", "payment.?method"}},
      {ErrorKind::InvalidRequest,
       {R"(\b400\b)", "bad.?request", "invalid.?request", "malformed.?request",
        "invalid.?parameter", "missing.?parameter"}},
  };
  return table;
}

RecoveryPolicy make_policy(bool retryable, long base, long max, Severity severity,
                           bool switch_provider, bool switch_credential) {
  return RecoveryPolicy{.retryable = retryable,
                        .backoff_base = std::chrono::seconds(base),
                        .backoff_max = std::chrono::seconds(max),
                        .severity = severity,
                        .switch_provider = switch_provider,
                        .switch_credential = switch_credential};
}

} // namespace

std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::RateLimit:
    return "rate_limit";
  case ErrorKind::QuotaExceeded:
    return "quota_exceeded";
  case ErrorKind::Authentication:
    return "authentication";
  case ErrorKind::Authorization:
    return "authorization";
  case ErrorKind::NotFound:
    return "not_found";
  case ErrorKind::ServerError:
    return "server_error";
  case ErrorKind::NetworkError:
    return "network_error";
  case ErrorKind::Timeout:
    return "timeout";
  case ErrorKind::PaymentRequired:
    return "payment_required";
  case ErrorKind::InvalidRequest:
    return "invalid_request";
  case ErrorKind::Unknown:
    return "unknown";
  }
  return "unknown";
}

std::string_view severity_name(const Severity severity) {
  switch (severity) {
  case Severity::Low:
    return "low";
  case Severity::Medium:
    return "medium";
  case Severity::High:
    return "high";
  case Severity::Critical:
    return "critical";
  }
  return "medium";
}

std::optional<ErrorKind> parse_error_kind(const std::string_view name) {
  static constexpr std::array kAll = {
      ErrorKind::RateLimit,     ErrorKind::QuotaExceeded,   ErrorKind::Authentication,
      ErrorKind::Authorization, ErrorKind::NotFound,        ErrorKind::ServerError,
      ErrorKind::NetworkError,  ErrorKind::Timeout,         ErrorKind::PaymentRequired,
      ErrorKind::InvalidRequest, ErrorKind::Unknown};
  for (const auto kind : kAll) {
    if (error_kind_name(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

ErrorClassifier::ErrorClassifier() {
  for (const auto &[kind, expressions] : pattern_table()) {
    for (const char *expression : expressions) {
      patterns_.push_back(Pattern{kind, std::regex(expression, kIcase)});
    }
  }
}

Classification ErrorClassifier::classify(const std::string &error_text) const {
  ErrorKind kind = ErrorKind::Unknown;
  for (const auto &pattern : patterns_) {
    if (std::regex_search(error_text, pattern.expression)) {
      kind = pattern.kind;
      break;
    }
  }

  const RecoveryPolicy &policy = policy_for(kind);
  return Classification{.kind = kind,
                        .severity = policy.severity,
                        .policy = policy,
                        .retry_after_seconds = extract_retry_after(error_text)};
}

const RecoveryPolicy &ErrorClassifier::policy_for(const ErrorKind kind) {
  static const RecoveryPolicy rate_limit = make_policy(true, 1, 60, Severity::Medium, true, true);
  static const RecoveryPolicy quota = make_policy(true, 60, 3600, Severity::High, true, true);
  static const RecoveryPolicy authentication =
      make_policy(false, 0, 0, Severity::Critical, false, true);
  static const RecoveryPolicy authorization =
      make_policy(false, 0, 0, Severity::Critical, true, false);
  static const RecoveryPolicy not_found = make_policy(false, 0, 0, Severity::High, true, false);
  static const RecoveryPolicy server = make_policy(true, 5, 300, Severity::Medium, true, false);
  static const RecoveryPolicy network = make_policy(true, 2, 60, Severity::Medium, false, false);
  static const RecoveryPolicy timeout = make_policy(true, 5, 120, Severity::Medium, false, false);
  static const RecoveryPolicy payment = make_policy(false, 0, 0, Severity::Critical, true, true);
  static const RecoveryPolicy invalid = make_policy(false, 0, 0, Severity::Low, false, false);
  static const RecoveryPolicy unknown = make_policy(true, 10, 300, Severity::Medium, true, false);

  switch (kind) {
  case ErrorKind::RateLimit:
    return rate_limit;
  case ErrorKind::QuotaExceeded:
    return quota;
  case ErrorKind::Authentication:
    return authentication;
  case ErrorKind::Authorization:
    return authorization;
  case ErrorKind::NotFound:
    return not_found;
  case ErrorKind::ServerError:
    return server;
  case ErrorKind::NetworkError:
    return network;
  case ErrorKind::Timeout:
    return timeout;
  case ErrorKind::PaymentRequired:
    return payment;
  case ErrorKind::InvalidRequest:
    return invalid;
  case ErrorKind::Unknown:
    return unknown;
  }
  return unknown;
}

std::optional<std::uint64_t> ErrorClassifier::extract_retry_after(const std::string &text) {
  static const std::vector<std::regex> hints = {
      std::regex(R"(retry.?after.?(\d+))", kIcase),
      std::regex(R"(wait.?(\d+).?seconds)", kIcase),
      std::regex(R"(try.?again.?in.?(\d+))", kIcase),
      std::regex(R"(back.?off.?(\d+))", kIcase),
  };

  for (const auto &hint : hints) {
    std::smatch match;
    if (std::regex_search(text, match, hint)) {
      try {
        return static_cast<std::uint64_t>(std::stoull(match[1].str()));
      } catch (const std::out_of_range &) {
        return std::nullopt;
      }
    }
  }
  return std::nullopt;
}

std::chrono::seconds ErrorClassifier::recommended_backoff(
    const ErrorKind kind, const std::uint32_t attempt,
    const std::optional<std::uint64_t> retry_after) {
  if (retry_after.has_value() && *retry_after > 0) {
    return std::chrono::seconds(*retry_after);
  }

  const RecoveryPolicy &policy = policy_for(kind);
  const double base = static_cast<double>(policy.backoff_base.count());
  const double max = static_cast<double>(policy.backoff_max.count());
  const double scaled = std::min(base * std::pow(2.0, static_cast<double>(attempt)), max);
  return std::chrono::seconds(std::max<long long>(1, static_cast<long long>(scaled)));
}

} // namespace inferguard::resilience
