#pragma once

#include "inferguard/common/clock.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace inferguard::resilience {

/// Request parameters that identify a cacheable call. Ordered so the key is stable.
using CacheParams = std::map<std::string, std::string>;

struct CacheOptions {
  std::chrono::seconds ttl{1800};
  std::size_t max_entries = 1000;
  // 0 hashes parameter values in full; otherwise only this many leading characters.
  std::size_t key_value_prefix_chars = 0;
};

class ResponseCache {
public:
  explicit ResponseCache(CacheOptions options = {},
                         std::shared_ptr<common::Clock> clock = common::default_clock());

  [[nodiscard]] std::optional<std::string> get(const std::string &provider,
                                               const std::string &method,
                                               const CacheParams &params) const;
  void put(const std::string &provider, const std::string &method, const CacheParams &params,
           std::string payload);

  /// SHA-256 over provider, method and the normalized parameters.
  [[nodiscard]] std::string make_key(const std::string &provider, const std::string &method,
                                     const CacheParams &params) const;

  /// Physical entries, expired ones included until they are purged or evicted.
  [[nodiscard]] std::size_t size() const;
  std::size_t purge_expired();
  void clear();

private:
  struct Entry {
    std::string payload;
    common::Clock::time_point created;
    common::Clock::time_point expires;
  };

  std::size_t purge_expired_locked(common::Clock::time_point now);
  void evict_oldest_locked();

  CacheOptions options_;
  std::shared_ptr<common::Clock> clock_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace inferguard::resilience
