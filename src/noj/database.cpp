#include "noj/database.h"

#include <algorithm>

#include <sqlite_orm/sqlite_orm.h>
#include <spdlog/spdlog.h>

namespace {

struct SubmissionRow {
  std::string id;
  int kind;
  int problem_id;
  std::string username;
  int language;
  int64_t timestamp;
  std::string ip_addr;
  int status;
  int score;
  long exec_time;
  long memory_usage;
  std::string tasks; // JSON
  int64_t last_send;
  std::string code_path;
  std::vector<char> legacy_code;
  bool zip_mode;
  std::string compiled_binary_path;
  std::optional<int> sa_status;
  std::string sa_message;
  std::string sa_report;
  std::string sa_report_path;
  std::string checker_summary;
  std::string checker_artifacts_path;
  std::string scoring_message;
  std::string scorer_artifacts_path;
  std::string scoring_breakdown; // JSON
  bool use_default_case;
  std::string custom_input_path;
  int64_t expire_at;
};

struct ProblemRow {
  int problem_id;
  std::string owner;
  std::string courses; // JSON
  std::string task_scores; // JSON
  int allowed_languages;
  int quota;
  bool trial_mode;
  int trial_quota;
  bool zip_mode;
  bool artifact_collection;
};

struct CourseMemberRow {
  std::string course;
  std::string username;
  int role;
};

struct HomeworkRow {
  int homework_id;
  std::string course;
  int64_t start;
  int64_t end;
  std::string problem_ids; // JSON
  std::string students; // JSON
  std::optional<int> penalty;
};

struct HomeworkStatusRow {
  int homework_id;
  std::string username;
  int problem_id;
  int score;
  int raw_score;
  int problem_status;
  std::string submission_ids; // JSON
};

struct UserRow {
  std::string username;
  int64_t last_submit;
};

struct UserProblemRow {
  std::string username;
  int problem_id;
  int submission_count;
  bool accepted;
  int quota_count;
  int64_t quota_last_submit;
};

struct TrialCountRow {
  int problem_id;
  std::string username;
  int count;
};

struct ConfigRow {
  int id;
  int rate_limit;
  std::string workers; // JSON
};

constexpr int kConfigId = 1;

inline auto InitStorage(const std::string& path) {
  using namespace sqlite_orm;
  auto storage = make_storage(path,
      make_index("idx_submissions_problem", &SubmissionRow::problem_id, &SubmissionRow::kind),
      make_index("idx_submissions_expire", &SubmissionRow::expire_at),
      make_table("submissions",
                 make_column("id", &SubmissionRow::id, primary_key()),
                 make_column("kind", &SubmissionRow::kind),
                 make_column("problem_id", &SubmissionRow::problem_id),
                 make_column("username", &SubmissionRow::username),
                 make_column("language", &SubmissionRow::language),
                 make_column("timestamp", &SubmissionRow::timestamp),
                 make_column("ip_addr", &SubmissionRow::ip_addr),
                 make_column("status", &SubmissionRow::status, default_value(-2)),
                 make_column("score", &SubmissionRow::score, default_value(-1)),
                 make_column("exec_time", &SubmissionRow::exec_time, default_value(-1)),
                 make_column("memory_usage", &SubmissionRow::memory_usage, default_value(-1)),
                 make_column("tasks", &SubmissionRow::tasks, default_value("[]")),
                 make_column("last_send", &SubmissionRow::last_send),
                 make_column("code_path", &SubmissionRow::code_path),
                 make_column("legacy_code", &SubmissionRow::legacy_code),
                 make_column("zip_mode", &SubmissionRow::zip_mode, default_value(false)),
                 make_column("compiled_binary_path", &SubmissionRow::compiled_binary_path),
                 make_column("sa_status", &SubmissionRow::sa_status),
                 make_column("sa_message", &SubmissionRow::sa_message),
                 make_column("sa_report", &SubmissionRow::sa_report),
                 make_column("sa_report_path", &SubmissionRow::sa_report_path),
                 make_column("checker_summary", &SubmissionRow::checker_summary),
                 make_column("checker_artifacts_path", &SubmissionRow::checker_artifacts_path),
                 make_column("scoring_message", &SubmissionRow::scoring_message),
                 make_column("scorer_artifacts_path", &SubmissionRow::scorer_artifacts_path),
                 make_column("scoring_breakdown", &SubmissionRow::scoring_breakdown),
                 make_column("use_default_case", &SubmissionRow::use_default_case, default_value(true)),
                 make_column("custom_input_path", &SubmissionRow::custom_input_path),
                 make_column("expire_at", &SubmissionRow::expire_at, default_value(0))),
      make_table("problems",
                 make_column("problem_id", &ProblemRow::problem_id, primary_key()),
                 make_column("owner", &ProblemRow::owner),
                 make_column("courses", &ProblemRow::courses),
                 make_column("task_scores", &ProblemRow::task_scores),
                 make_column("allowed_languages", &ProblemRow::allowed_languages),
                 make_column("quota", &ProblemRow::quota, default_value(-1)),
                 make_column("trial_mode", &ProblemRow::trial_mode, default_value(false)),
                 make_column("trial_quota", &ProblemRow::trial_quota, default_value(-1)),
                 make_column("zip_mode", &ProblemRow::zip_mode, default_value(false)),
                 make_column("artifact_collection", &ProblemRow::artifact_collection,
                             default_value(false))),
      make_table("course_members",
                 make_column("course", &CourseMemberRow::course),
                 make_column("username", &CourseMemberRow::username),
                 make_column("role", &CourseMemberRow::role),
                 primary_key(&CourseMemberRow::course, &CourseMemberRow::username)),
      make_table("homeworks",
                 make_column("homework_id", &HomeworkRow::homework_id, primary_key()),
                 make_column("course", &HomeworkRow::course),
                 make_column("start", &HomeworkRow::start),
                 make_column("end", &HomeworkRow::end),
                 make_column("problem_ids", &HomeworkRow::problem_ids),
                 make_column("students", &HomeworkRow::students),
                 make_column("penalty", &HomeworkRow::penalty)),
      make_table("homework_status",
                 make_column("homework_id", &HomeworkStatusRow::homework_id),
                 make_column("username", &HomeworkStatusRow::username),
                 make_column("problem_id", &HomeworkStatusRow::problem_id),
                 make_column("score", &HomeworkStatusRow::score),
                 make_column("raw_score", &HomeworkStatusRow::raw_score),
                 make_column("problem_status", &HomeworkStatusRow::problem_status),
                 make_column("submission_ids", &HomeworkStatusRow::submission_ids),
                 primary_key(&HomeworkStatusRow::homework_id, &HomeworkStatusRow::username,
                             &HomeworkStatusRow::problem_id)),
      make_table("users",
                 make_column("username", &UserRow::username, primary_key()),
                 make_column("last_submit", &UserRow::last_submit, default_value(0))),
      make_table("user_problems",
                 make_column("username", &UserProblemRow::username),
                 make_column("problem_id", &UserProblemRow::problem_id),
                 make_column("submission_count", &UserProblemRow::submission_count),
                 make_column("accepted", &UserProblemRow::accepted),
                 make_column("quota_count", &UserProblemRow::quota_count),
                 make_column("quota_last_submit", &UserProblemRow::quota_last_submit),
                 primary_key(&UserProblemRow::username, &UserProblemRow::problem_id)),
      make_table("trial_counts",
                 make_column("problem_id", &TrialCountRow::problem_id),
                 make_column("username", &TrialCountRow::username),
                 make_column("count", &TrialCountRow::count),
                 primary_key(&TrialCountRow::problem_id, &TrialCountRow::username)),
      make_table("submission_config",
                 make_column("id", &ConfigRow::id, primary_key()),
                 make_column("rate_limit", &ConfigRow::rate_limit),
                 make_column("workers", &ConfigRow::workers)));
  storage.sync_schema(true);
  return storage;
}

SubmissionRow ToRow(const Submission& sub) {
  return SubmissionRow{
    .id = sub.id,
    .kind = (int)sub.kind,
    .problem_id = sub.problem_id,
    .username = sub.user,
    .language = (int)sub.language,
    .timestamp = sub.timestamp,
    .ip_addr = sub.ip_addr,
    .status = sub.status,
    .score = sub.score,
    .exec_time = sub.exec_time,
    .memory_usage = sub.memory_usage,
    .tasks = nlohmann::json(sub.tasks).dump(),
    .last_send = sub.last_send,
    .code_path = sub.code_path,
    .legacy_code = std::vector<char>(sub.legacy_code.begin(), sub.legacy_code.end()),
    .zip_mode = sub.zip_mode,
    .compiled_binary_path = sub.compiled_binary_path,
    .sa_status = sub.sa_status,
    .sa_message = sub.sa_message,
    .sa_report = sub.sa_report,
    .sa_report_path = sub.sa_report_path,
    .checker_summary = sub.checker_summary,
    .checker_artifacts_path = sub.checker_artifacts_path,
    .scoring_message = sub.scoring_message,
    .scorer_artifacts_path = sub.scorer_artifacts_path,
    .scoring_breakdown = sub.scoring_breakdown.is_null() ? "" : sub.scoring_breakdown.dump(),
    .use_default_case = sub.use_default_case,
    .custom_input_path = sub.custom_input_path,
    .expire_at = sub.expire_at,
  };
}

Submission FromRow(SubmissionRow&& row) {
  Submission sub;
  sub.id = std::move(row.id);
  sub.kind = (SubmissionKind)row.kind;
  sub.problem_id = row.problem_id;
  sub.user = std::move(row.username);
  sub.language = (Language)row.language;
  sub.timestamp = row.timestamp;
  sub.ip_addr = std::move(row.ip_addr);
  sub.status = row.status;
  sub.score = row.score;
  sub.exec_time = row.exec_time;
  sub.memory_usage = row.memory_usage;
  sub.tasks = nlohmann::json::parse(row.tasks).get<std::vector<TaskResult>>();
  sub.last_send = row.last_send;
  sub.code_path = std::move(row.code_path);
  sub.legacy_code.assign(row.legacy_code.begin(), row.legacy_code.end());
  sub.zip_mode = row.zip_mode;
  sub.compiled_binary_path = std::move(row.compiled_binary_path);
  sub.sa_status = row.sa_status;
  sub.sa_message = std::move(row.sa_message);
  sub.sa_report = std::move(row.sa_report);
  sub.sa_report_path = std::move(row.sa_report_path);
  sub.checker_summary = std::move(row.checker_summary);
  sub.checker_artifacts_path = std::move(row.checker_artifacts_path);
  sub.scoring_message = std::move(row.scoring_message);
  sub.scorer_artifacts_path = std::move(row.scorer_artifacts_path);
  if (row.scoring_breakdown.size()) sub.scoring_breakdown = nlohmann::json::parse(row.scoring_breakdown);
  sub.use_default_case = row.use_default_case;
  sub.custom_input_path = std::move(row.custom_input_path);
  sub.expire_at = row.expire_at;
  return sub;
}

template <class T>
std::string ToJsonText(const T& val) {
  return nlohmann::json(val).dump();
}

template <class T>
T FromJsonText(const std::string& text) {
  if (text.empty()) return T{};
  return nlohmann::json::parse(text).get<T>();
}

Homework FromRow(HomeworkRow&& row) {
  return Homework{
    .homework_id = row.homework_id,
    .course = std::move(row.course),
    .start = row.start,
    .end = row.end,
    .problem_ids = FromJsonText<std::vector<int>>(row.problem_ids),
    .students = FromJsonText<std::vector<std::string>>(row.students),
    .penalty = row.penalty,
  };
}

} // namespace

struct DatabaseStorage {
  decltype(InitStorage("")) storage;
  explicit DatabaseStorage(const std::string& path) : storage(InitStorage(path)) {}
};

Database::Database(const fs::path& path) :
    db_(std::make_unique<DatabaseStorage>(path.string())) {
  spdlog::info("Opened database {}", path.c_str());
}

Database::~Database() = default;

/// --- submissions ---

void Database::Insert(const Submission& sub) {
  std::lock_guard lck(mtx_);
  db_->storage.replace(ToRow(sub));
}

std::optional<Submission> Database::FindLocked_(const std::string& id) {
  auto row = db_->storage.get_pointer<SubmissionRow>(id);
  if (!row) return std::nullopt;
  return FromRow(std::move(*row));
}

std::optional<Submission> Database::Find(const std::string& id) {
  std::lock_guard lck(mtx_);
  return FindLocked_(id);
}

std::vector<Submission> Database::ListByProblem(int problem_id, SubmissionKind kind) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  std::vector<Submission> ret;
  for (auto& row : db_->storage.get_all<SubmissionRow>(
           where(c(&SubmissionRow::problem_id) == problem_id && c(&SubmissionRow::kind) == (int)kind),
           order_by(&SubmissionRow::timestamp))) {
    ret.push_back(FromRow(std::move(row)));
  }
  return ret;
}

std::vector<Submission> Database::ListExpired(int64_t now) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  std::vector<Submission> ret;
  for (auto& row : db_->storage.get_all<SubmissionRow>(
           where(c(&SubmissionRow::expire_at) > 0 && c(&SubmissionRow::expire_at) <= now))) {
    ret.push_back(FromRow(std::move(row)));
  }
  return ret;
}

bool Database::Remove(const std::string& id) {
  std::lock_guard lck(mtx_);
  if (!db_->storage.get_pointer<SubmissionRow>(id)) return false;
  db_->storage.remove<SubmissionRow>(id);
  return true;
}

void Database::SetCodePath(const std::string& id, const std::string& path) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  db_->storage.update_all(set(c(&SubmissionRow::code_path) = path),
                          where(c(&SubmissionRow::id) == id));
}

void Database::ClearLegacyCode(const std::string& id) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  db_->storage.update_all(set(c(&SubmissionRow::legacy_code) = std::vector<char>()),
                          where(c(&SubmissionRow::id) == id));
}

void Database::SetCustomInputPath(const std::string& id, const std::string& path) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  db_->storage.update_all(set(c(&SubmissionRow::custom_input_path) = path),
                          where(c(&SubmissionRow::id) == id));
}

void Database::SetCompiledBinaryPath(const std::string& id, const std::string& path) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  db_->storage.update_all(set(c(&SubmissionRow::compiled_binary_path) = path),
                          where(c(&SubmissionRow::id) == id));
}

bool Database::SetCaseOutputPath(const std::string& id, size_t task, size_t test_case,
                                 const std::string& path) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  auto sub = FindLocked_(id);
  if (!sub || task >= sub->tasks.size() || test_case >= sub->tasks[task].cases.size()) {
    return false;
  }
  sub->tasks[task].cases[test_case].output_path = path;
  db_->storage.update_all(set(c(&SubmissionRow::tasks) = ToJsonText(sub->tasks)),
                          where(c(&SubmissionRow::id) == id));
  return true;
}

void Database::MarkJudging(const std::string& id, int64_t last_send) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  db_->storage.update_all(set(c(&SubmissionRow::status) = (int)Status::JUDGING,
                              c(&SubmissionRow::last_send) = last_send),
                          where(c(&SubmissionRow::id) == id));
}

void Database::StoreResult(const std::string& id, const JudgeOutcome& res) {
  std::lock_guard lck(mtx_);
  auto row = db_->storage.get_pointer<SubmissionRow>(id);
  if (!row) return;
  row->status = res.status;
  row->score = res.score;
  row->exec_time = res.exec_time;
  row->memory_usage = res.memory_usage;
  row->tasks = ToJsonText(res.tasks);
  row->sa_status = res.sa_status;
  row->sa_message = res.sa_message;
  row->sa_report = res.sa_report;
  row->sa_report_path = res.sa_report_path;
  row->checker_summary = res.checker_summary;
  row->checker_artifacts_path = res.checker_artifacts_path;
  row->scoring_message = res.scoring_message;
  row->scorer_artifacts_path = res.scorer_artifacts_path;
  row->scoring_breakdown = res.scoring_breakdown.is_null() ? "" : res.scoring_breakdown.dump();
  db_->storage.update(*row);
}

void Database::ResetForRejudge(const std::string& id, int64_t last_send) {
  std::lock_guard lck(mtx_);
  auto row = db_->storage.get_pointer<SubmissionRow>(id);
  if (!row) return;
  row->status = (int)Status::JUDGING;
  row->score = -1;
  row->exec_time = -1;
  row->memory_usage = -1;
  row->tasks = "[]";
  row->last_send = last_send;
  row->sa_status.reset();
  row->sa_message.clear();
  row->sa_report.clear();
  row->sa_report_path.clear();
  row->checker_summary.clear();
  row->checker_artifacts_path.clear();
  row->scoring_message.clear();
  row->scorer_artifacts_path.clear();
  row->scoring_breakdown.clear();
  db_->storage.update(*row);
}

void Database::StoreGrade(const std::string& id, int status, int score) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  db_->storage.update_all(set(c(&SubmissionRow::status) = status, c(&SubmissionRow::score) = score),
                          where(c(&SubmissionRow::id) == id));
}

/// --- catalog ---

std::optional<ProblemInfo> Database::FindProblem(int problem_id) {
  std::lock_guard lck(mtx_);
  auto row = db_->storage.get_pointer<ProblemRow>(problem_id);
  if (!row) return std::nullopt;
  return ProblemInfo{
    .problem_id = row->problem_id,
    .owner = row->owner,
    .courses = FromJsonText<std::vector<std::string>>(row->courses),
    .task_scores = FromJsonText<std::vector<int>>(row->task_scores),
    .allowed_languages = row->allowed_languages,
    .quota = row->quota,
    .trial_mode = row->trial_mode,
    .trial_quota = row->trial_quota,
    .zip_mode = row->zip_mode,
    .artifact_collection = row->artifact_collection,
  };
}

std::optional<CourseRole> Database::RoleIn(const std::string& course, const std::string& user) {
  std::lock_guard lck(mtx_);
  auto row = db_->storage.get_pointer<CourseMemberRow>(course, user);
  if (!row) return std::nullopt;
  return (CourseRole)row->role;
}

std::vector<Homework> Database::HomeworksOf(int problem_id) {
  std::lock_guard lck(mtx_);
  std::vector<Homework> ret;
  for (auto& row : db_->storage.get_all<HomeworkRow>()) {
    Homework hw = FromRow(std::move(row));
    if (std::find(hw.problem_ids.begin(), hw.problem_ids.end(), problem_id) != hw.problem_ids.end()) {
      ret.push_back(std::move(hw));
    }
  }
  return ret;
}

void Database::UpsertProblem(const ProblemInfo& problem) {
  std::lock_guard lck(mtx_);
  db_->storage.replace(ProblemRow{
    .problem_id = problem.problem_id,
    .owner = problem.owner,
    .courses = ToJsonText(problem.courses),
    .task_scores = ToJsonText(problem.task_scores),
    .allowed_languages = problem.allowed_languages,
    .quota = problem.quota,
    .trial_mode = problem.trial_mode,
    .trial_quota = problem.trial_quota,
    .zip_mode = problem.zip_mode,
    .artifact_collection = problem.artifact_collection,
  });
}

void Database::SetRole(const std::string& course, const std::string& user, CourseRole role) {
  std::lock_guard lck(mtx_);
  db_->storage.replace(CourseMemberRow{course, user, (int)role});
}

void Database::UpsertHomework(const Homework& hw) {
  std::lock_guard lck(mtx_);
  db_->storage.replace(HomeworkRow{
    .homework_id = hw.homework_id,
    .course = hw.course,
    .start = hw.start,
    .end = hw.end,
    .problem_ids = ToJsonText(hw.problem_ids),
    .students = ToJsonText(hw.students),
    .penalty = hw.penalty,
  });
}

/// --- gradebook ---

void Database::RecordSubmission(const std::string& user, int problem_id,
                                const std::string& submission_id, bool accepted) {
  std::lock_guard lck(mtx_);
  auto row = db_->storage.get_pointer<UserProblemRow>(user, problem_id);
  UserProblemRow stat = row ? *row : UserProblemRow{user, problem_id, 0, false, 0, 0};
  stat.submission_count++;
  stat.accepted = stat.accepted || accepted;
  db_->storage.replace(stat);
  spdlog::debug("Recorded submission {} for {} on problem {}", submission_id, user, problem_id);
}

std::vector<int> Database::AcceptedProblems(const std::string& user) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  return db_->storage.select(&UserProblemRow::problem_id,
      where(c(&UserProblemRow::username) == user && c(&UserProblemRow::accepted) == true),
      order_by(&UserProblemRow::problem_id));
}

std::optional<HomeworkProblemStatus> Database::FindHomeworkStatus(
    int homework_id, const std::string& user, int problem_id) {
  std::lock_guard lck(mtx_);
  if (auto row = db_->storage.get_pointer<HomeworkStatusRow>(homework_id, user, problem_id)) {
    return HomeworkProblemStatus{
      .score = row->score,
      .raw_score = row->raw_score,
      .problem_status = row->problem_status,
      .submission_ids = FromJsonText<std::vector<std::string>>(row->submission_ids),
    };
  }
  // students listed in the homework start with an empty status
  auto hw = db_->storage.get_pointer<HomeworkRow>(homework_id);
  if (!hw) return std::nullopt;
  auto students = FromJsonText<std::vector<std::string>>(hw->students);
  if (std::find(students.begin(), students.end(), user) == students.end()) return std::nullopt;
  return HomeworkProblemStatus{};
}

void Database::SaveHomeworkStatus(int homework_id, const std::string& user, int problem_id,
                                  const HomeworkProblemStatus& status) {
  std::lock_guard lck(mtx_);
  db_->storage.replace(HomeworkStatusRow{
    .homework_id = homework_id,
    .username = user,
    .problem_id = problem_id,
    .score = status.score,
    .raw_score = status.raw_score,
    .problem_status = status.problem_status,
    .submission_ids = ToJsonText(status.submission_ids),
  });
}

int Database::TrialCount(int problem_id, const std::string& user) {
  std::lock_guard lck(mtx_);
  auto row = db_->storage.get_pointer<TrialCountRow>(problem_id, user);
  return row ? row->count : 0;
}

void Database::IncrementTrialCount(int problem_id, const std::string& user) {
  std::lock_guard lck(mtx_);
  auto row = db_->storage.get_pointer<TrialCountRow>(problem_id, user);
  db_->storage.replace(TrialCountRow{problem_id, user, (row ? row->count : 0) + 1});
}

QuotaCounter Database::FindQuota(const std::string& user, int problem_id) {
  std::lock_guard lck(mtx_);
  auto row = db_->storage.get_pointer<UserProblemRow>(user, problem_id);
  if (!row) return QuotaCounter{};
  return QuotaCounter{row->quota_count, row->quota_last_submit};
}

void Database::SaveQuota(const std::string& user, int problem_id, const QuotaCounter& quota) {
  std::lock_guard lck(mtx_);
  auto row = db_->storage.get_pointer<UserProblemRow>(user, problem_id);
  UserProblemRow stat = row ? *row : UserProblemRow{user, problem_id, 0, false, 0, 0};
  stat.quota_count = quota.submit_count;
  stat.quota_last_submit = quota.last_submit;
  db_->storage.replace(stat);
}

int64_t Database::LastSubmit(const std::string& user) {
  std::lock_guard lck(mtx_);
  auto row = db_->storage.get_pointer<UserRow>(user);
  return row ? row->last_submit : 0;
}

void Database::SetLastSubmit(const std::string& user, int64_t timestamp) {
  std::lock_guard lck(mtx_);
  db_->storage.replace(UserRow{user, timestamp});
}

/// --- config ---

std::optional<SubmissionConfig> Database::LoadSubmissionConfig() {
  std::lock_guard lck(mtx_);
  auto row = db_->storage.get_pointer<ConfigRow>(kConfigId);
  if (!row) return std::nullopt;
  return SubmissionConfig{
    .rate_limit = row->rate_limit,
    .workers = FromJsonText<std::vector<WorkerRegistration>>(row->workers),
  };
}

void Database::SaveSubmissionConfig(const SubmissionConfig& config) {
  std::lock_guard lck(mtx_);
  db_->storage.replace(ConfigRow{kConfigId, config.rate_limit, ToJsonText(config.workers)});
}
