#include "olt-client/query/ResultCache.hpp"
#include "olt-client/Logger.hpp"
#include "olt-client/parser/OutputParsers.hpp"

namespace oltclient {
namespace query {

ResultCache::ResultCache(std::chrono::milliseconds ttl) : ttl_(ttl) {}

std::string ResultCache::normalize_key(const std::string &key) {
  return parser::to_lower(key);
}

std::optional<UnitInfo> ResultCache::get(const std::string &device,
                                         const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find({device, normalize_key(key)});
  if (it == entries_.end())
    return std::nullopt;

  if (std::chrono::steady_clock::now() - it->second.stored_at >= ttl_) {
    LOG_DEBUG(device, "CACHE", "Entry for '{}' expired", key);
    entries_.erase(it);
    return std::nullopt;
  }
  return it->second.unit;
}

void ResultCache::put(const std::string &device, const std::string &key,
                      const UnitInfo &unit) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[{device, normalize_key(key)}] =
      Entry{unit, std::chrono::steady_clock::now()};
}

size_t ResultCache::sweep() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = std::chrono::steady_clock::now();
  size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now - it->second.stored_at >= ttl_) {
      it = entries_.erase(it);
      removed++;
    } else {
      ++it;
    }
  }
  return removed;
}

void ResultCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

void ResultCache::clear(const std::string &device) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->first.first == device)
      it = entries_.erase(it);
    else
      ++it;
  }
}

size_t ResultCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace query
} // namespace oltclient
