#ifndef NOJ_JUDGING_POLICY_H_
#define NOJ_JUDGING_POLICY_H_

#include <memory>
#include <optional>

#include "noj/catalog.h"
#include "noj/submission.h"

/// Rules that differ between formal and trial submissions

class JudgingPolicy {
 public:
  virtual ~JudgingPolicy() = default;
  virtual int TaskScore(size_t task, int status) = 0;
  virtual void FinishJudging(const Submission&) = 0;
};

class FormalPolicy : public JudgingPolicy {
  Catalog& catalog_;
  Gradebook& gradebook_;
  std::optional<ProblemInfo> problem_;

  void UpdateHomeworks_(const Submission&);
 public:
  FormalPolicy(Catalog& catalog, Gradebook& gradebook, int problem_id) :
      catalog_(catalog), gradebook_(gradebook), problem_(catalog.FindProblem(problem_id)) {}

  // the point value of the task if accepted
  int TaskScore(size_t task, int status) override;
  void FinishJudging(const Submission&) override;
};

class TrialPolicy : public JudgingPolicy {
  Gradebook& gradebook_;
 public:
  explicit TrialPolicy(Gradebook& gradebook) : gradebook_(gradebook) {}

  // trials are pass/fail per case
  int TaskScore(size_t, int) override { return 0; }
  void FinishJudging(const Submission&) override;
};

std::unique_ptr<JudgingPolicy> MakeJudgingPolicy(const Submission&, Catalog&, Gradebook&);

struct Lateness {
  int homework_id;
  long seconds; // 0 if on time
};

// The least late of the homeworks that count the submission; ties go to the
// first homework listed.
std::optional<Lateness> LeastLateHomework(Catalog&, const Submission&);
// -1 if the submission counts for no homework
long LateSeconds(Catalog&, const Submission&);

#endif  // NOJ_JUDGING_POLICY_H_
