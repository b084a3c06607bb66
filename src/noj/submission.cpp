#include "noj/submission.h"

void to_json(nlohmann::json& j, const CaseResult& res) {
  j = nlohmann::json{
    {"status", res.status},
    {"execTime", res.exec_time},
    {"memoryUsage", res.memory_usage},
    {"outputPath", res.output_path},
  };
}

void from_json(const nlohmann::json& j, CaseResult& res) {
  res.status = j.at("status").get<int>();
  res.exec_time = j.at("execTime").get<long>();
  res.memory_usage = j.at("memoryUsage").get<long>();
  res.output_path = j.value("outputPath", "");
}

void to_json(nlohmann::json& j, const TaskResult& res) {
  j = nlohmann::json{
    {"status", res.status},
    {"execTime", res.exec_time},
    {"memoryUsage", res.memory_usage},
    {"score", res.score},
    {"cases", res.cases},
  };
}

void from_json(const nlohmann::json& j, TaskResult& res) {
  res.status = j.at("status").get<int>();
  res.exec_time = j.at("execTime").get<long>();
  res.memory_usage = j.at("memoryUsage").get<long>();
  res.score = j.at("score").get<int>();
  res.cases = j.at("cases").get<std::vector<CaseResult>>();
}
