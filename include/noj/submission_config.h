#ifndef INCLUDE_NOJ_SUBMISSION_CONFIG_H_
#define INCLUDE_NOJ_SUBMISSION_CONFIG_H_

#include <string>
#include <vector>
#include <optional>

#include <nlohmann/json.hpp>

struct WorkerRegistration {
  std::string name;
  std::string url;
  // shared secret presented by the worker on artifact uploads
  std::string token;
};

struct SubmissionConfig {
  // minimum seconds between two formal submissions of a user
  int rate_limit = 0;
  std::vector<WorkerRegistration> workers;

  static SubmissionConfig Default();
};

void to_json(nlohmann::json&, const WorkerRegistration&);
void from_json(const nlohmann::json&, WorkerRegistration&);
void to_json(nlohmann::json&, const SubmissionConfig&);
void from_json(const nlohmann::json&, SubmissionConfig&);

class ConfigStore {
 public:
  virtual ~ConfigStore() = default;
  virtual std::optional<SubmissionConfig> LoadSubmissionConfig() = 0;
  virtual void SaveSubmissionConfig(const SubmissionConfig&) = 0;
};

#endif  // INCLUDE_NOJ_SUBMISSION_CONFIG_H_
