#pragma once
#include "olt-client/export.h"
#include "olt-client/types.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace oltclient {
namespace query {

/// Recently found units keyed by (device, lower-cased description)
class OLT_CLIENT_API ResultCache {
public:
  explicit ResultCache(std::chrono::milliseconds ttl = std::chrono::minutes(5));

  /// Cached record if present and younger than the TTL. Expired entries are
  /// removed on the way.
  std::optional<UnitInfo> get(const std::string &device,
                              const std::string &key);

  void put(const std::string &device, const std::string &key,
           const UnitInfo &unit);

  /// Remove every expired entry; returns how many were removed
  size_t sweep();

  void clear();
  void clear(const std::string &device);

  size_t size() const;
  std::chrono::milliseconds ttl() const { return ttl_; }

  static std::string normalize_key(const std::string &key);

private:
  struct Entry {
    UnitInfo unit;
    std::chrono::steady_clock::time_point stored_at;
  };

  using CacheKey = std::pair<std::string, std::string>;

  std::chrono::milliseconds ttl_;
  mutable std::mutex mutex_;
  std::map<CacheKey, Entry> entries_;
};

} // namespace query
} // namespace oltclient
