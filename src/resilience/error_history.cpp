#include "inferguard/resilience/error_history.hpp"

#include <algorithm>

namespace inferguard::resilience {

ErrorHistory::ErrorHistory(const std::size_t capacity) : capacity_(std::max<std::size_t>(1, capacity)) {}

std::uint64_t ErrorHistory::count_of(const Counts &counts, const ErrorKind kind) {
  const auto it = counts.find(kind);
  return it == counts.end() ? 0 : it->second;
}

std::uint64_t ErrorHistory::total_of(const Counts &counts) {
  std::uint64_t total = 0;
  for (const auto &[kind, count] : counts) {
    total += count;
  }
  return total;
}

void ErrorHistory::record(ErrorRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!record.provider.empty()) {
    ++provider_counts_[record.provider][record.kind];
  }
  ++credential_counts_[{record.provider, record.key_index}][record.kind];

  records_.push_back(std::move(record));
  while (records_.size() > capacity_) {
    records_.pop_front();
  }
}

ErrorStatistics ErrorHistory::statistics(const std::size_t recent_count) const {
  std::lock_guard<std::mutex> lock(mutex_);
  ErrorStatistics stats;
  stats.total_errors = records_.size();
  for (const auto &record : records_) {
    ++stats.by_kind[std::string(error_kind_name(record.kind))];
    ++stats.by_severity[std::string(severity_name(record.severity))];
    if (!record.provider.empty()) {
      ++stats.by_provider[record.provider];
    }
  }

  const std::size_t recent = std::min(recent_count, records_.size());
  stats.recent.assign(records_.end() - static_cast<std::ptrdiff_t>(recent), records_.end());

  for (const auto &[provider, counts] : provider_counts_) {
    ProviderErrorHealth health;
    health.total_errors = total_of(counts);
    health.critical_errors = count_of(counts, ErrorKind::Authentication) +
                             count_of(counts, ErrorKind::PaymentRequired);
    for (const auto &[kind, count] : counts) {
      health.breakdown[std::string(error_kind_name(kind))] = count;
    }
    if (health.critical_errors > 0) {
      health.grade = "critical";
    } else if (health.total_errors > 10) {
      health.grade = "poor";
    } else if (health.total_errors > 5) {
      health.grade = "fair";
    } else {
      health.grade = "good";
    }
    stats.provider_health[provider] = std::move(health);
  }
  return stats;
}

std::map<std::string, std::string> ErrorHistory::recommendations() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, std::string> out;
  for (const auto &[provider, counts] : provider_counts_) {
    const std::uint64_t total = total_of(counts);
    if (total == 0) {
      out[provider] = "Healthy - no errors recorded";
    } else if (count_of(counts, ErrorKind::Authentication) > 0) {
      out[provider] = "Check API key configuration - authentication failures detected";
    } else if (count_of(counts, ErrorKind::PaymentRequired) > 0) {
      out[provider] = "Check billing/subscription - payment required errors detected";
    } else if (count_of(counts, ErrorKind::QuotaExceeded) > 5) {
      out[provider] = "Consider upgrading plan - frequent quota exceeded errors";
    } else if (count_of(counts, ErrorKind::RateLimit) > 10) {
      out[provider] = "Lower request rate - frequent rate limit errors";
    } else if (total > 15) {
      out[provider] = "Monitor closely - high error rate detected";
    } else {
      out[provider] = "Stable with minor issues - continue monitoring";
    }
  }
  return out;
}

bool ErrorHistory::should_switch_provider(const std::string &provider) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = provider_counts_.find(provider);
  if (it == provider_counts_.end()) {
    return false;
  }
  const auto &counts = it->second;
  const std::uint64_t critical =
      count_of(counts, ErrorKind::Authentication) + count_of(counts, ErrorKind::PaymentRequired);
  if (critical >= 2) {
    return true;
  }
  const std::uint64_t limited =
      count_of(counts, ErrorKind::RateLimit) + count_of(counts, ErrorKind::QuotaExceeded);
  return limited >= 5;
}

bool ErrorHistory::should_switch_credential(const std::string &provider,
                                            const std::size_t key_index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = credential_counts_.find({provider, key_index});
  if (it == credential_counts_.end()) {
    return false;
  }
  return count_of(it->second, ErrorKind::Authentication) >= 1 ||
         count_of(it->second, ErrorKind::QuotaExceeded) >= 3;
}

std::uint64_t ErrorHistory::provider_error_count(const std::string &provider) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = provider_counts_.find(provider);
  return it == provider_counts_.end() ? 0 : total_of(it->second);
}

std::size_t ErrorHistory::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

void ErrorHistory::clear(const std::optional<std::string> &provider) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!provider.has_value()) {
    records_.clear();
    provider_counts_.clear();
    credential_counts_.clear();
    return;
  }

  records_.erase(std::remove_if(records_.begin(), records_.end(),
                                [&](const ErrorRecord &record) {
                                  return record.provider == *provider;
                                }),
                 records_.end());
  provider_counts_.erase(*provider);
  for (auto it = credential_counts_.begin(); it != credential_counts_.end();) {
    if (it->first.first == *provider) {
      it = credential_counts_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace inferguard::resilience
