#pragma once

#include "inferguard/resilience/error_classifier.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace inferguard::resilience {

struct ErrorRecord {
  std::chrono::system_clock::time_point timestamp;
  ErrorKind kind = ErrorKind::Unknown;
  Severity severity = Severity::Medium;
  std::string provider;
  std::size_t key_index = 0;
  std::string message;
};

struct ProviderErrorHealth {
  std::string grade;
  std::uint64_t total_errors = 0;
  std::uint64_t critical_errors = 0;
  std::map<std::string, std::uint64_t> breakdown;
};

struct ErrorStatistics {
  std::uint64_t total_errors = 0;
  std::map<std::string, std::uint64_t> by_kind;
  std::map<std::string, std::uint64_t> by_severity;
  std::map<std::string, std::uint64_t> by_provider;
  std::vector<ErrorRecord> recent;
  std::map<std::string, ProviderErrorHealth> provider_health;
};

/// Bounded ring of classified failures plus cumulative per-provider and
/// per-credential counters. The counters outlive records dropped from the ring.
class ErrorHistory {
public:
  explicit ErrorHistory(std::size_t capacity = 1000);

  void record(ErrorRecord record);

  [[nodiscard]] ErrorStatistics statistics(std::size_t recent_count = 10) const;
  [[nodiscard]] std::map<std::string, std::string> recommendations() const;

  /// Two or more credential-fatal errors, or five or more rate/quota errors.
  [[nodiscard]] bool should_switch_provider(const std::string &provider) const;
  /// Any authentication failure, or three or more quota errors on that credential.
  [[nodiscard]] bool should_switch_credential(const std::string &provider,
                                              std::size_t key_index) const;

  [[nodiscard]] std::uint64_t provider_error_count(const std::string &provider) const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t capacity() const { return capacity_; }

  void clear(const std::optional<std::string> &provider = std::nullopt);

private:
  using Counts = std::map<ErrorKind, std::uint64_t>;

  [[nodiscard]] static std::uint64_t count_of(const Counts &counts, ErrorKind kind);
  [[nodiscard]] static std::uint64_t total_of(const Counts &counts);

  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<ErrorRecord> records_;
  std::map<std::string, Counts> provider_counts_;
  std::map<std::pair<std::string, std::size_t>, Counts> credential_counts_;
};

} // namespace inferguard::resilience
