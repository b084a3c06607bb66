#include "noj/cache.h"

#include <chrono>
#include <thread>
#include <vector>

#include <cpp_redis/cpp_redis>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

constexpr int kRedisMaxRetries = 5;

// DEL only if the stored value matches ARGV[1]
const char kEraseIfEqualScript[] =
    "if redis.call('GET', KEYS[1]) == ARGV[1] then "
    "return redis.call('DEL', KEYS[1]) end return 0";

} // namespace

struct RedisClient {
  const RedisConfig& config;
  cpp_redis::client client;

  explicit RedisClient(const RedisConfig& config) : config(config) {}

  bool Connect() {
    spdlog::info("Redis: connecting to {}:{}", config.host, config.port);
    try {
      client.connect(config.host, config.port,
          [](const std::string& host, size_t port, cpp_redis::connect_state status) {
            if (status == cpp_redis::connect_state::dropped) {
              spdlog::warn("Redis: disconnected from {}:{}", host, port);
            }
          });
      if (config.password.size()) {
        auto future = client.auth(config.password);
        client.sync_commit();
        if (auto reply = future.get(); reply.is_error()) {
          spdlog::error("Redis: authentication failed: {}", reply.error());
          return false;
        }
      }
    } catch (const cpp_redis::redis_error& err) {
      spdlog::error("Redis: unable to connect to {}:{}: {}", config.host, config.port, err.what());
      return false;
    }
    return client.is_connected();
  }

  void Reconnect(bool force) {
    if (force && client.is_connected()) client.disconnect(true);
    for (int fail = 0; !client.is_connected(); ++fail) {
      if (fail >= kRedisMaxRetries) throw CacheError("unable to connect to redis server");
      if (fail > 0) std::this_thread::sleep_for(std::chrono::milliseconds(config.retry_interval));
      Connect();
    }
  }

  cpp_redis::reply Execute(const std::vector<std::string>& command) {
    Reconnect(false);
    std::string message;
    for (int fail = 0; fail < kRedisMaxRetries; ++fail) {
      auto future = client.send(command);
      client.sync_commit();
      cpp_redis::reply reply = future.get();
      if (!reply.is_error()) return reply;
      message = reply.error();
      spdlog::warn("Redis: {} failed: {}", command[0], message);
      Reconnect(true);
    }
    throw CacheError(fmt::format("unable to finish redis {}: {}", command[0], message));
  }
};

RedisCache::RedisCache(RedisConfig config) :
    config_(std::move(config)), client_(std::make_unique<RedisClient>(config_)) {}

RedisCache::~RedisCache() = default;

bool RedisCache::Ping() {
  std::lock_guard lck(mtx_);
  try {
    client_->Execute({"PING"});
  } catch (const CacheError& err) {
    spdlog::warn("Redis: {}", err.what());
    return false;
  }
  return true;
}

void RedisCache::Set(const std::string& key, const std::string& value, long ttl) {
  std::vector<std::string> command = {"SET", Key_(key), value};
  if (ttl > 0) {
    command.push_back("EX");
    command.push_back(std::to_string(ttl));
  }
  std::lock_guard lck(mtx_);
  client_->Execute(command);
}

std::optional<std::string> RedisCache::Get(const std::string& key) {
  std::lock_guard lck(mtx_);
  auto reply = client_->Execute({"GET", Key_(key)});
  if (!reply.is_string()) return std::nullopt;
  return reply.as_string();
}

bool RedisCache::Erase(const std::string& key) {
  std::lock_guard lck(mtx_);
  auto reply = client_->Execute({"DEL", Key_(key)});
  return reply.is_integer() && reply.as_integer() > 0;
}

bool RedisCache::EraseIfEqual(const std::string& key, const std::string& expected) {
  std::lock_guard lck(mtx_);
  auto reply = client_->Execute({"EVAL", kEraseIfEqualScript, "1", Key_(key), expected});
  return reply.is_integer() && reply.as_integer() > 0;
}
