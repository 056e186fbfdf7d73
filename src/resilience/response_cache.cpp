#include "inferguard/resilience/response_cache.hpp"

#include "inferguard/common/fs.hpp"
#include "inferguard/common/hash.hpp"
#include "inferguard/observability/global.hpp"

#include <algorithm>
#include <vector>

namespace inferguard::resilience {

ResponseCache::ResponseCache(CacheOptions options, std::shared_ptr<common::Clock> clock)
    : options_(options), clock_(std::move(clock)) {}

std::string ResponseCache::make_key(const std::string &provider, const std::string &method,
                                    const CacheParams &params) const {
  std::string material = provider + ":" + method;
  for (const auto &[name, raw_value] : params) {
    std::string value = common::trim(raw_value);
    if (options_.key_value_prefix_chars > 0 && value.size() > options_.key_value_prefix_chars) {
      value.resize(options_.key_value_prefix_chars);
    }
    material += "\n" + name + "=" + std::to_string(value.size()) + ":" + value;
  }
  return common::sha256_hex(material);
}

std::optional<std::string> ResponseCache::get(const std::string &provider,
                                              const std::string &method,
                                              const CacheParams &params) const {
  const std::string key = make_key(provider, method, params);
  const auto now = clock_->now();
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(key);
  if (it == entries_.end() || now > it->second.expires) {
    return std::nullopt;
  }
  return it->second.payload;
}

void ResponseCache::put(const std::string &provider, const std::string &method,
                        const CacheParams &params, std::string payload) {
  if (options_.max_entries == 0) {
    return;
  }
  const std::string key = make_key(provider, method, params);
  const auto now = clock_->now();
  std::size_t entries = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!entries_.contains(key) && entries_.size() >= options_.max_entries) {
      purge_expired_locked(now);
      if (entries_.size() >= options_.max_entries) {
        evict_oldest_locked();
      }
    }
    entries_[key] = Entry{.payload = std::move(payload), .created = now, .expires = now + options_.ttl};
    entries = entries_.size();
  }
  observability::record_metric(observability::CacheEntriesMetric{.entries = entries});
}

std::size_t ResponseCache::purge_expired_locked(const common::Clock::time_point now) {
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now > it->second.expires) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

// Drops the oldest tenth of the entries (at least one) in creation order.
void ResponseCache::evict_oldest_locked() {
  std::vector<std::pair<common::Clock::time_point, std::string>> by_age;
  by_age.reserve(entries_.size());
  for (const auto &[key, entry] : entries_) {
    by_age.emplace_back(entry.created, key);
  }
  const std::size_t to_remove = std::max<std::size_t>(1, options_.max_entries / 10);
  const auto middle = by_age.begin() + static_cast<std::ptrdiff_t>(std::min(to_remove, by_age.size()));
  std::partial_sort(by_age.begin(), middle, by_age.end());
  for (auto it = by_age.begin(); it != middle; ++it) {
    entries_.erase(it->second);
  }
}

std::size_t ResponseCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::size_t ResponseCache::purge_expired() {
  const auto now = clock_->now();
  std::lock_guard<std::mutex> lock(mutex_);
  return purge_expired_locked(now);
}

void ResponseCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

} // namespace inferguard::resilience
