#ifndef INCLUDE_NOJ_TOKEN_BROKER_H_
#define INCLUDE_NOJ_TOKEN_BROKER_H_

#include <string>
#include <optional>

#include "cache.h"

// Single-use credentials for worker callbacks. Each dispatch attempt gets a
// fresh token keyed by submission id and bound to the worker it was sent to;
// issuing again replaces the previous token, and a successful verification
// consumes it.
class TokenBroker {
  KeyValueCache& cache_;
  long ttl_;

  static std::string TokenKey_(const std::string& submission_id);
  static std::string WorkerKey_(const std::string& submission_id);
 public:
  // ttl <= 0: a token lives until it is consumed or replaced
  explicit TokenBroker(KeyValueCache& cache, long ttl = 0) : cache_(cache), ttl_(ttl) {}

  std::string Issue(const std::string& submission_id, const std::string& worker);
  // Returns the worker the token was issued for, or std::nullopt if the token
  // is not the live one.
  std::optional<std::string> Verify(const std::string& submission_id, const std::string& token);
  void Revoke(const std::string& submission_id);
};

#endif  // INCLUDE_NOJ_TOKEN_BROKER_H_
