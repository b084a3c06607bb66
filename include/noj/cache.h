#ifndef INCLUDE_NOJ_CACHE_H_
#define INCLUDE_NOJ_CACHE_H_

#include <mutex>
#include <memory>
#include <string>
#include <optional>

#include "errors.h"

// Key-value store with per-entry expiry. Holds the ephemeral state shared
// between requests and server processes: dispatch tokens and capability sets.
class KeyValueCache {
 public:
  virtual ~KeyValueCache() = default;

  // ttl in seconds; ttl <= 0 keeps the entry until erased
  virtual void Set(const std::string& key, const std::string& value, long ttl = 0) = 0;
  virtual std::optional<std::string> Get(const std::string& key) = 0;
  virtual bool Erase(const std::string& key) = 0;
  // Erases the entry in one step if it holds exactly `expected`.
  virtual bool EraseIfEqual(const std::string& key, const std::string& expected) = 0;
};

struct RedisConfig {
  std::string host = "127.0.0.1";
  int port = 6379;
  std::string password;
  int retry_interval = 1000; // milliseconds
  // prepended to every key
  std::string prefix = "noj:";
};

struct RedisClient;

class RedisCache : public KeyValueCache {
  RedisConfig config_;
  std::unique_ptr<RedisClient> client_;
  // cpp_redis pipelines commands per client; one request at a time
  std::mutex mtx_;

  std::string Key_(const std::string& key) const { return config_.prefix + key; }
 public:
  explicit RedisCache(RedisConfig config);
  ~RedisCache();

  // false if the server cannot be reached
  bool Ping();

  // the following throw CacheError
  void Set(const std::string& key, const std::string& value, long ttl = 0) override;
  std::optional<std::string> Get(const std::string& key) override;
  bool Erase(const std::string& key) override;
  bool EraseIfEqual(const std::string& key, const std::string& expected) override;
};

#endif  // INCLUDE_NOJ_CACHE_H_
