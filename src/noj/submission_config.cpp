#include "noj/submission_config.h"

SubmissionConfig SubmissionConfig::Default() {
  return SubmissionConfig{
    .rate_limit = 0,
    .workers = {{"Sandbox-0", "http://sandbox:1450", "KoNoSandboxDa"}},
  };
}

void to_json(nlohmann::json& j, const WorkerRegistration& worker) {
  j = nlohmann::json{{"name", worker.name}, {"url", worker.url}, {"token", worker.token}};
}

void from_json(const nlohmann::json& j, WorkerRegistration& worker) {
  worker.name = j.at("name").get<std::string>();
  worker.url = j.at("url").get<std::string>();
  worker.token = j.at("token").get<std::string>();
}

void to_json(nlohmann::json& j, const SubmissionConfig& config) {
  j = nlohmann::json{{"rateLimit", config.rate_limit}, {"sandboxInstances", config.workers}};
}

void from_json(const nlohmann::json& j, SubmissionConfig& config) {
  config.rate_limit = j.value("rateLimit", 0);
  config.workers = j.at("sandboxInstances").get<std::vector<WorkerRegistration>>();
}
