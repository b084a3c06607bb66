#ifndef INCLUDE_NOJ_DATABASE_H_
#define INCLUDE_NOJ_DATABASE_H_

#include <mutex>
#include <memory>
#include <filesystem>

#include "catalog.h"
#include "submission_store.h"
#include "submission_config.h"

namespace fs = std::filesystem;

struct DatabaseStorage;

// SQLite-backed implementation of every persistent interface of the pipeline.
class Database : public SubmissionStore, public Catalog, public Gradebook, public ConfigStore {
  std::unique_ptr<DatabaseStorage> db_;
  // the storage object is not safe to share between request threads
  std::mutex mtx_;

  std::optional<Submission> FindLocked_(const std::string& id);
 public:
  explicit Database(const fs::path& path);
  ~Database();

  // SubmissionStore
  void Insert(const Submission&) override;
  std::optional<Submission> Find(const std::string& id) override;
  std::vector<Submission> ListByProblem(int problem_id, SubmissionKind) override;
  std::vector<Submission> ListExpired(int64_t now) override;
  bool Remove(const std::string& id) override;
  void SetCodePath(const std::string& id, const std::string& path) override;
  void ClearLegacyCode(const std::string& id) override;
  void SetCustomInputPath(const std::string& id, const std::string& path) override;
  void SetCompiledBinaryPath(const std::string& id, const std::string& path) override;
  bool SetCaseOutputPath(const std::string& id, size_t task, size_t test_case,
                         const std::string& path) override;
  void MarkJudging(const std::string& id, int64_t last_send) override;
  void StoreResult(const std::string& id, const JudgeOutcome&) override;
  void ResetForRejudge(const std::string& id, int64_t last_send) override;
  void StoreGrade(const std::string& id, int status, int score) override;

  // Catalog
  std::optional<ProblemInfo> FindProblem(int problem_id) override;
  std::optional<CourseRole> RoleIn(const std::string& course, const std::string& user) override;
  std::vector<Homework> HomeworksOf(int problem_id) override;

  // Gradebook
  void RecordSubmission(const std::string& user, int problem_id,
                        const std::string& submission_id, bool accepted) override;
  std::vector<int> AcceptedProblems(const std::string& user) override;
  std::optional<HomeworkProblemStatus> FindHomeworkStatus(
      int homework_id, const std::string& user, int problem_id) override;
  void SaveHomeworkStatus(int homework_id, const std::string& user, int problem_id,
                          const HomeworkProblemStatus&) override;
  int TrialCount(int problem_id, const std::string& user) override;
  void IncrementTrialCount(int problem_id, const std::string& user) override;
  QuotaCounter FindQuota(const std::string& user, int problem_id) override;
  void SaveQuota(const std::string& user, int problem_id, const QuotaCounter&) override;
  int64_t LastSubmit(const std::string& user) override;
  void SetLastSubmit(const std::string& user, int64_t) override;

  // ConfigStore
  std::optional<SubmissionConfig> LoadSubmissionConfig() override;
  void SaveSubmissionConfig(const SubmissionConfig&) override;

  // Mirrors of the course/problem management data. Written by the
  // management side; the pipeline itself only reads them.
  void UpsertProblem(const ProblemInfo&);
  void SetRole(const std::string& course, const std::string& user, CourseRole);
  void UpsertHomework(const Homework&);
};

#endif  // INCLUDE_NOJ_DATABASE_H_
