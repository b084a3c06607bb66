#ifndef INCLUDE_NOJ_LIFECYCLE_H_
#define INCLUDE_NOJ_LIFECYCLE_H_

#include <string>
#include <cstdint>

#include "utils.h"
#include "catalog.h"
#include "dispatch.h"
#include "submission.h"
#include "artifact_store.h"
#include "submission_store.h"

// seconds
constexpr int64_t kRejudgeCooldown = 300;
constexpr int64_t kDeleteCooldown = 600;
constexpr int64_t kRejudgeAllCooldown = 60;
constexpr int64_t kDefaultTrialTtl = 14 * 86400;

struct CreateRequest {
  Actor actor;
  int problem_id;
  Language language;
  SubmissionKind kind = SubmissionKind::FORMAL;
  std::string ip_addr;
  // trial only
  bool use_default_case = true;
};

struct RejudgeSummary {
  int rejudged = 0, skipped = 0, failed = 0;
};

class LifecycleManager {
  SubmissionStore& store_;
  ArtifactStore& artifacts_;
  DispatchCoordinator& dispatch_;
  Catalog& catalog_;
  Gradebook& gradebook_;
  Clock clock_;
  int64_t trial_ttl_;

  void CheckFormalQuota_(const Actor&, const ProblemInfo&, int64_t now);
  void CheckTrialQuota_(const Actor&, const ProblemInfo&, bool grader);
  void RemoveOutputs_(const Submission&);
  void RemoveArtifacts_(const Submission&);
  bool Resend_(Submission&, int64_t now);
  void SupersedeHandwritten_(const Submission&);
 public:
  LifecycleManager(SubmissionStore& store, ArtifactStore& artifacts, DispatchCoordinator& dispatch,
                   Catalog& catalog, Gradebook& gradebook, Clock clock = UnixTimestamp,
                   int64_t trial_ttl = kDefaultTrialTtl) :
      store_(store), artifacts_(artifacts), dispatch_(dispatch), catalog_(catalog),
      gradebook_(gradebook), clock_(std::move(clock)), trial_ttl_(trial_ttl) {}

  // throws NotFoundError, ValidationError, PermissionError, RateLimitError
  Submission Create(const CreateRequest&);
  // Stores and dispatches the code of a submission. A new handwritten
  // submission replaces the user's older ones for the same problem.
  // throws the errors of DispatchCoordinator::Submit
  bool Upload(const std::string& id, const std::string& code);
  // Manual grade of a formal handwritten submission: AC for 100, WA otherwise.
  // throws NotFoundError, ValidationError
  void Grade(const std::string& id, int score);
  // Re-dispatches a judged submission, or a pending or judging one whose
  // last dispatch is older than the cooldown.
  // throws NotFoundError, TryLaterError, ValidationError, QueueFullError,
  //   InvalidTokenError
  bool Rejudge(const std::string& id);
  // Formal submissions of a problem; pending and handwritten ones and those
  // dispatched in the last minute are skipped.
  RejudgeSummary RejudgeAll(int problem_id);
  // throws NotFoundError, ConflictError
  void Delete(const std::string& id);
  // removes expired trial submissions and their artifacts; returns the count
  size_t PurgeExpired();
};

#endif  // INCLUDE_NOJ_LIFECYCLE_H_
