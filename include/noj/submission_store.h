#ifndef INCLUDE_NOJ_SUBMISSION_STORE_H_
#define INCLUDE_NOJ_SUBMISSION_STORE_H_

#include <string>
#include <vector>
#include <optional>

#include "submission.h"

// Durable submission records. Judging state (status, score, tasks) has no
// general setter: MarkJudging is used by dispatch, StoreResult by result
// ingestion, ResetForRejudge and StoreGrade by the lifecycle manager.
class SubmissionStore {
 public:
  virtual ~SubmissionStore() = default;

  virtual void Insert(const Submission&) = 0;
  virtual std::optional<Submission> Find(const std::string& id) = 0;
  virtual std::vector<Submission> ListByProblem(int problem_id, SubmissionKind) = 0;
  // trial submissions whose expiry time is at or before now
  virtual std::vector<Submission> ListExpired(int64_t now) = 0;
  virtual bool Remove(const std::string& id) = 0;

  virtual void SetCodePath(const std::string& id, const std::string& path) = 0;
  virtual void ClearLegacyCode(const std::string& id) = 0;
  virtual void SetCustomInputPath(const std::string& id, const std::string& path) = 0;
  virtual void SetCompiledBinaryPath(const std::string& id, const std::string& path) = 0;
  // false if the case does not exist
  virtual bool SetCaseOutputPath(const std::string& id, size_t task, size_t test_case,
                                 const std::string& path) = 0;

  virtual void MarkJudging(const std::string& id, int64_t last_send) = 0;
  virtual void StoreResult(const std::string& id, const JudgeOutcome&) = 0;
  // clears tasks and results, status back to judging
  virtual void ResetForRejudge(const std::string& id, int64_t last_send) = 0;
  // manual grade of a handwritten submission
  virtual void StoreGrade(const std::string& id, int status, int score) = 0;
};

#endif  // INCLUDE_NOJ_SUBMISSION_STORE_H_
