#include "noj/ingestion.h"

#include <cctype>
#include <charconv>
#include <algorithm>
#include <initializer_list>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "noj/paths.h"
#include "noj/errors.h"
#include "judging_policy.h"

using nlohmann::json;

namespace {

// one case of the callback, decoded
struct CaseReport {
  int status;
  long exec_time;
  long memory_usage;
  std::optional<std::string> stdout_text;
  std::optional<std::string> stderr_text;
};

std::optional<std::string> OptionalString(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return std::nullopt;
  if (it->is_string()) return it->get<std::string>();
  return it->dump();
}

// the first of the keys that holds a non-empty string
std::string FirstString(const json& obj, std::initializer_list<const char*> keys) {
  if (!obj.is_object()) return "";
  for (auto key : keys) {
    if (auto val = OptionalString(obj, key); val && val->size()) return *val;
  }
  return "";
}

std::string Trim(const std::string& str) {
  const char* kSpaces = " \t\r\n";
  size_t begin = str.find_first_not_of(kSpaces);
  if (begin == std::string::npos) return "";
  return str.substr(begin, str.find_last_not_of(kSpaces) - begin + 1);
}

std::vector<std::vector<CaseReport>> DecodeTasks(const std::string& id, const json& tasks) {
  if (!tasks.is_array()) throw ValidationError("tasks must be a list");
  std::vector<std::vector<CaseReport>> ret;
  try {
    for (auto& task : tasks) {
      if (!task.is_array()) throw ValidationError("each task must be a list of cases");
      auto& cases = ret.emplace_back();
      for (auto& item : task) {
        // exitCode is transport-only and dropped here
        std::string name = item.at("status").get<std::string>();
        Status status = AbrToStatus(name);
        if (status == Status::UNRECOGNIZED) {
          spdlog::warn("Unrecognized status {} in result of submission {}", name, id);
        }
        cases.push_back(CaseReport{
          .status = (int)status,
          .exec_time = item.at("execTime").get<long>(),
          .memory_usage = item.at("memoryUsage").get<long>(),
          .stdout_text = OptionalString(item, "stdout"),
          .stderr_text = OptionalString(item, "stderr"),
        });
      }
    }
  } catch (json::exception& err) {
    throw ValidationError(fmt::format("invalid data: {}", err.what()));
  }
  return ret;
}

// explicit score of a scorer; unparsable values count as 0
std::optional<int> ScoreOverride(const json& scoring) {
  if (!scoring.is_object()) return std::nullopt;
  auto it = scoring.find("score");
  if (it == scoring.end() || it->is_null()) return std::nullopt;
  if (it->is_number_integer()) return it->get<int>();
  if (it->is_number_float()) return static_cast<int>(it->get<double>());
  if (it->is_string()) {
    std::string str = Trim(it->get<std::string>());
    int val = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), val);
    if (str.size() && ec == std::errc() && ptr == str.data() + str.size()) return val;
  }
  return 0;
}

template <class T>
void AggregateMax(const std::vector<T>& items, int& status, long& exec_time, long& memory_usage) {
  if (items.empty()) {
    status = (int)Status::UNRECOGNIZED;
    exec_time = memory_usage = -1;
    return;
  }
  status = items[0].status;
  exec_time = items[0].exec_time;
  memory_usage = items[0].memory_usage;
  for (auto& item : items) {
    status = std::max(status, item.status);
    exec_time = std::max(exec_time, item.exec_time);
    memory_usage = std::max(memory_usage, item.memory_usage);
  }
}

} // namespace

ResultPayload ResultPayload::FromJson(const json& body) {
  if (!body.is_object() || !body.contains("tasks")) throw ValidationError("missing tasks");
  ResultPayload ret;
  ret.tasks = body["tasks"];
  ret.static_analysis = body.value("staticAnalysis", json());
  ret.checker = body.value("checker", json());
  ret.scoring = body.value("scoring", json());
  if (auto val = OptionalString(body, "statusOverride"); val && val->size()) {
    ret.status_override = std::move(val);
  }
  return ret;
}

std::string ResultIngestion::PutText_(const std::string& name, const std::string& text) {
  if (!artifacts_.Put(name, text)) throw StorageError(fmt::format("failed to store {}", name));
  return name;
}

void ResultIngestion::ProcessResult(const std::string& id, const ResultPayload& payload) {
  auto sub = store_.Find(id);
  if (!sub) throw NotFoundError(fmt::format("{} not found", id));
  spdlog::info("Receive result of submission {}", id);
  auto reports = DecodeTasks(id, payload.tasks);
  auto policy = MakeJudgingPolicy(*sub, catalog_, gradebook_);
  JudgeOutcome res{};

  // static analysis
  if (auto& sa = payload.static_analysis; sa.is_object() && !sa.empty()) {
    std::string sa_status = FirstString(sa, {"status"});
    std::transform(sa_status.begin(), sa_status.end(), sa_status.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (sa_status != "skip") res.sa_status = sa_status == "pass" ? 0 : 1;
    res.sa_message = FirstString(sa, {"message"});
    res.sa_report = FirstString(sa, {"report"});
    if (auto path = FirstString(sa, {"reportPath"}); path.size()) {
      res.sa_report_path = path;
    } else if (res.sa_report.size()) {
      res.sa_report_path = PutText_(StaticAnalysisObjectName(id), res.sa_report);
    }
  }

  // checker
  if (auto& checker = payload.checker; checker.is_object() && !checker.empty()) {
    std::vector<std::string> lines;
    if (auto it = checker.find("messages"); it != checker.end() && it->is_array()) {
      for (auto& msg : *it) {
        if (!msg.is_object()) continue;
        std::string text = FirstString(msg, {"message"});
        if (text.empty()) continue;
        std::string line;
        if (auto case_no = OptionalString(msg, "case")) line += *case_no + ": ";
        if (auto status = FirstString(msg, {"status"}); status.size()) line += "[" + status + "]";
        lines.push_back(Trim(line + " " + Trim(text)));
      }
    }
    res.checker_summary = fmt::format("{}", fmt::join(lines, "\n"));
    json artifacts = checker.value("artifacts", json::object());
    if (auto path = FirstString(artifacts, {"checkResultPath", "path", "checkerPath"}); path.size()) {
      res.checker_artifacts_path = path;
    } else if (auto text = FirstString(artifacts, {"checkResult"}); text.size()) {
      res.checker_artifacts_path = PutText_(CheckerObjectName(id), text);
    }
  }

  // scoring
  std::optional<int> score_override = ScoreOverride(payload.scoring);
  std::optional<int> scoring_status;
  if (auto& scoring = payload.scoring; scoring.is_object() && !scoring.empty()) {
    if (auto name = FirstString(scoring, {"status"}); name.size()) {
      if (Status status = AbrToStatus(name); status != Status::UNRECOGNIZED) {
        scoring_status = (int)status;
      }
    }
    res.scoring_message = FirstString(scoring, {"message"});
    if (auto it = scoring.find("breakdown"); it != scoring.end() && it->is_object()) {
      res.scoring_breakdown = *it;
    }
    json artifacts = scoring.value("artifacts", json::object());
    if (auto path = FirstString(artifacts, {"path", "scorerPath", "checkResultPath"}); path.size()) {
      res.scorer_artifacts_path = path;
    } else if (auto text = FirstString(artifacts, {"text", "stdout", "stderr"}); text.size()) {
      res.scorer_artifacts_path = PutText_(ScorerObjectName(id), text);
    }
  }

  // cases and tasks
  for (size_t i = 0; i < reports.size(); i++) {
    TaskResult task{};
    for (size_t j = 0; j < reports[i].size(); j++) {
      auto& report = reports[i][j];
      if (!report.stdout_text) {
        spdlog::error("Key stdout not in case result of submission {} {:02d}{:02d}", id, i, j);
      }
      if (!report.stderr_text) {
        spdlog::error("Key stderr not in case result of submission {} {:02d}{:02d}", id, i, j);
      }
      std::string path = CaseOutputObjectName(sub->kind, i, j);
      PutText_(path, PackCaseOutput(CaseOutput{
        .stdout_text = report.stdout_text.value_or(""),
        .stderr_text = report.stderr_text.value_or(""),
      }));
      task.cases.push_back(CaseResult{report.status, report.exec_time, report.memory_usage, path});
    }
    AggregateMax(task.cases, task.status, task.exec_time, task.memory_usage);
    task.score = policy->TaskScore(i, task.status);
    res.tasks.push_back(std::move(task));
  }
  AggregateMax(res.tasks, res.status, res.exec_time, res.memory_usage);
  res.score = 0;
  for (auto& task : res.tasks) res.score += task.score;
  if (score_override) res.score = *score_override;

  // overrides win over the aggregated status
  std::optional<int> override_status;
  if (payload.status_override) {
    Status status = AbrToStatus(*payload.status_override);
    override_status = status == Status::UNRECOGNIZED ? res.status : (int)status;
  }
  if (scoring_status) override_status = scoring_status;
  if (override_status) res.status = *override_status;

  store_.StoreResult(id, res);
  spdlog::info("Submission {} judged: status={} score={}", id, res.status, res.score);
  sub = store_.Find(id);
  if (!sub) {
    spdlog::warn("Submission {} deleted while judging", id);
    return;
  }
  policy->FinishJudging(*sub);
}

void ResultIngestion::RecordDispatchFailure(const Submission& sub, const std::string& message,
                                            Status status) {
  std::string path = TrialErrorObjectName(sub.id);
  if (!artifacts_.Put(path, PackCaseOutput(CaseOutput{"", message}))) {
    spdlog::warn("Failed to store dispatch error output of submission {}", sub.id);
    path.clear();
  }
  int code = (int)status;
  JudgeOutcome res{
    .status = code,
    .score = 0,
    .exec_time = 0,
    .memory_usage = 0,
    .tasks = {TaskResult{code, 0, 0, 0, {CaseResult{code, 0, 0, path}}}},
  };
  store_.StoreResult(sub.id, res);
  spdlog::info("Marked submission {} as {} before judging: {}", sub.id, StatusToAbr(status), message);
}

long ResultIngestion::LateSeconds(const Submission& sub) {
  return ::LateSeconds(catalog_, sub);
}
