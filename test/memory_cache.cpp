#include "memory_cache.h"

MemoryCache::Entry* MemoryCache::Find_(const std::string& key) {
  auto it = map_.find(key);
  if (it == map_.end()) return nullptr;
  if (it->second.expire_at && it->second.expire_at <= clock_()) {
    map_.erase(it);
    return nullptr;
  }
  return &it->second;
}

void MemoryCache::Set(const std::string& key, const std::string& value, long ttl) {
  std::lock_guard lck(mtx_);
  map_[key] = Entry{value, ttl > 0 ? clock_() + ttl : 0};
}

std::optional<std::string> MemoryCache::Get(const std::string& key) {
  std::lock_guard lck(mtx_);
  if (auto entry = Find_(key)) return entry->value;
  return std::nullopt;
}

bool MemoryCache::Erase(const std::string& key) {
  std::lock_guard lck(mtx_);
  return Find_(key) && map_.erase(key);
}

bool MemoryCache::EraseIfEqual(const std::string& key, const std::string& expected) {
  std::lock_guard lck(mtx_);
  auto entry = Find_(key);
  if (!entry || entry->value != expected) return false;
  map_.erase(key);
  return true;
}

size_t MemoryCache::Size() {
  std::lock_guard lck(mtx_);
  for (auto it = map_.begin(); it != map_.end();) {
    if (it->second.expire_at && it->second.expire_at <= clock_()) {
      it = map_.erase(it);
    } else {
      ++it;
    }
  }
  return map_.size();
}
