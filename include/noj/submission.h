#ifndef INCLUDE_NOJ_SUBMISSION_H_
#define INCLUDE_NOJ_SUBMISSION_H_

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include <nlohmann/json.hpp>

#define ENUM_LANGUAGE_ \
  X(C, "c", ".c") \
  X(CPP, "cpp", ".cpp") \
  X(PYTHON, "python", ".py") \
  X(HANDWRITTEN, "handwritten", ".pdf")
enum class Language {
#define X(name, abr, ext) name,
  ENUM_LANGUAGE_
#undef X
};

// the max of every case would be the task status, and the max of every task
//   would be the submission status; higher code means worse outcome
#define ENUM_STATUS_ \
  X(UNRECOGNIZED, -3, "", "Unrecognized") \
  X(PENDING, -2, "", "Pending") \
  X(JUDGING, -1, "", "Judging") \
  X(AC, 0, "AC", "Accepted") \
  X(WA, 1, "WA", "Wrong Answer") \
  X(CE, 2, "CE", "Compile Error") \
  X(TLE, 3, "TLE", "Time Limit Exceeded") \
  X(MLE, 4, "MLE", "Memory Limit Exceeded") \
  X(RE, 5, "RE", "Runtime Error") \
  X(JE, 6, "JE", "Judge Error") \
  X(OLE, 7, "OLE", "Output Limit Exceeded") \
  X(AE, 8, "AE", "Analysis Error")
enum class Status : int {
#define X(name, code, abr, desc) name = code,
  ENUM_STATUS_
#undef X
};

#define ENUM_SUBMISSION_KIND_ \
  X(FORMAL, "normal") \
  X(TRIAL, "trial")
enum class SubmissionKind {
#define X(name, flag) name,
  ENUM_SUBMISSION_KIND_
#undef X
};

struct CaseResult {
  int status;
  long exec_time;
  long memory_usage;
  // compressed stdout/stderr in the artifact store
  std::string output_path;
};

struct TaskResult {
  int status;
  long exec_time;
  long memory_usage;
  int score;
  std::vector<CaseResult> cases;
};

void to_json(nlohmann::json&, const CaseResult&);
void from_json(const nlohmann::json&, CaseResult&);
void to_json(nlohmann::json&, const TaskResult&);
void from_json(const nlohmann::json&, TaskResult&);

// Everything a judging pass writes to a submission at once.
struct JudgeOutcome {
  int status;
  int score;
  long exec_time;
  long memory_usage;
  std::vector<TaskResult> tasks;

  std::optional<int> sa_status;
  std::string sa_message, sa_report, sa_report_path;
  std::string checker_summary, checker_artifacts_path;
  std::string scoring_message, scorer_artifacts_path;
  nlohmann::json scoring_breakdown; // null if absent
};

class Submission {
 public:
  // identity
  std::string id;
  SubmissionKind kind = SubmissionKind::FORMAL;
  int problem_id = 0;
  std::string user;
  Language language = Language::C;
  int64_t timestamp = 0; // UNIX timestamp, seconds
  std::string ip_addr;

  // judging state
  int status = (int)Status::PENDING;
  int score = -1;
  long exec_time = -1;
  long memory_usage = -1;
  std::vector<TaskResult> tasks;
  int64_t last_send = 0;

  // code; either code_path points into the artifact store or legacy_code holds
  //   the blob written by the previous storage layout
  std::string code_path;
  std::string legacy_code;
  bool zip_mode = false;
  std::string compiled_binary_path;

  // auxiliary reports
  std::optional<int> sa_status;
  std::string sa_message, sa_report, sa_report_path;
  std::string checker_summary, checker_artifacts_path;
  std::string scoring_message, scorer_artifacts_path;
  nlohmann::json scoring_breakdown;

  // trial only
  bool use_default_case = true;
  std::string custom_input_path;
  int64_t expire_at = 0; // 0 for never

  bool IsTrial() const { return kind == SubmissionKind::TRIAL; }
  bool IsJudging() const { return status == (int)Status::JUDGING; }
  bool IsPending() const { return status == (int)Status::PENDING; }
  bool HasCode() const { return code_path.size() || legacy_code.size(); }
};

#endif  // INCLUDE_NOJ_SUBMISSION_H_
