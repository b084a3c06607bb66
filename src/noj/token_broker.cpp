#include "noj/token_broker.h"

#include <spdlog/spdlog.h>

#include "utils.h"

std::string TokenBroker::TokenKey_(const std::string& submission_id) {
  return "stoken_" + submission_id;
}

std::string TokenBroker::WorkerKey_(const std::string& submission_id) {
  return "sworker_" + submission_id;
}

std::string TokenBroker::Issue(const std::string& submission_id, const std::string& worker) {
  std::string token = Base64UrlEncode(RandomBytes());
  cache_.Set(WorkerKey_(submission_id), worker, ttl_);
  cache_.Set(TokenKey_(submission_id), token, ttl_);
  spdlog::debug("Issued token for submission {} on worker {}", submission_id, worker);
  return token;
}

std::optional<std::string> TokenBroker::Verify(const std::string& submission_id,
                                               const std::string& token) {
  if (token.empty() || !cache_.EraseIfEqual(TokenKey_(submission_id), token)) {
    spdlog::warn("Invalid token presented for submission {}", submission_id);
    return std::nullopt;
  }
  auto worker = cache_.Get(WorkerKey_(submission_id));
  IGNORE_RETURN(cache_.Erase(WorkerKey_(submission_id)));
  return worker.value_or("");
}

void TokenBroker::Revoke(const std::string& submission_id) {
  IGNORE_RETURN(cache_.Erase(TokenKey_(submission_id)));
  IGNORE_RETURN(cache_.Erase(WorkerKey_(submission_id)));
}
