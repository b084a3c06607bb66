#include "noj/lifecycle.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "noj/errors.h"
#include "utils.h"
#include "judging_policy.h"

namespace {

int64_t DayOf(int64_t timestamp) {
  return timestamp / 86400;
}

} // namespace

void LifecycleManager::CheckFormalQuota_(const Actor& actor, const ProblemInfo& problem,
                                         int64_t now) {
  int rate_limit = dispatch_.Config().rate_limit;
  if (rate_limit > 0) {
    int64_t elapsed = now - gradebook_.LastSubmit(actor.username);
    if (elapsed < rate_limit) {
      throw RateLimitError("Submit too fast!", rate_limit - elapsed);
    }
  }
  if (problem.quota >= 0) {
    QuotaCounter quota = gradebook_.FindQuota(actor.username, problem.problem_id);
    if (DayOf(quota.last_submit) != DayOf(now)) quota.submit_count = 0;
    if (quota.submit_count >= problem.quota) {
      throw PermissionError("you have used all your quotas");
    }
    quota.submit_count++;
    quota.last_submit = now;
    gradebook_.SaveQuota(actor.username, problem.problem_id, quota);
  }
}

void LifecycleManager::CheckTrialQuota_(const Actor& actor, const ProblemInfo& problem,
                                        bool grader) {
  if (!problem.trial_mode) {
    throw PermissionError("Trial mode is disabled but receive trial submission");
  }
  if (grader || problem.trial_quota < 0) return;
  if (gradebook_.TrialCount(problem.problem_id, actor.username) >= problem.trial_quota) {
    throw PermissionError("Quota for trial submission exceeded");
  }
}

Submission LifecycleManager::Create(const CreateRequest& req) {
  auto problem = catalog_.FindProblem(req.problem_id);
  if (!problem) throw NotFoundError("Unexisted problem id.");
  if (!catalog_.CanView(req.actor, *problem)) {
    throw PermissionError("problem permission denied");
  }
  if (!problem->AllowsLanguage(req.language)) throw ValidationError("not allowed language");

  int64_t now = clock_();
  bool grader = catalog_.CanGrade(req.actor, *problem);
  if (req.kind == SubmissionKind::TRIAL) {
    CheckTrialQuota_(req.actor, *problem, grader);
  } else {
    if (!grader) CheckFormalQuota_(req.actor, *problem, now);
    gradebook_.SetLastSubmit(req.actor.username, now);
  }

  Submission sub;
  sub.id = RandomId();
  sub.kind = req.kind;
  sub.problem_id = req.problem_id;
  sub.user = req.actor.username;
  sub.language = req.language;
  sub.timestamp = now;
  sub.last_send = now;
  sub.ip_addr = req.ip_addr;
  sub.zip_mode = problem->zip_mode;
  if (sub.IsTrial()) {
    sub.use_default_case = req.use_default_case;
    sub.expire_at = now + trial_ttl_;
  }
  store_.Insert(sub);
  spdlog::info("Created {} submission {} (user {}, problem {}, {})",
               SubmissionKindFlag(sub.kind), sub.id, sub.user, sub.problem_id,
               LanguageName(sub.language));
  return sub;
}

void LifecycleManager::RemoveOutputs_(const Submission& sub) {
  for (auto& task : sub.tasks) {
    for (auto& cs : task.cases) {
      if (cs.output_path.size()) IGNORE_RETURN(artifacts_.Remove(cs.output_path));
    }
  }
}

void LifecycleManager::RemoveArtifacts_(const Submission& sub) {
  RemoveOutputs_(sub);
  if (sub.code_path.size()) IGNORE_RETURN(artifacts_.Remove(sub.code_path));
  if (sub.custom_input_path.size()) IGNORE_RETURN(artifacts_.Remove(sub.custom_input_path));
  if (sub.compiled_binary_path.size()) IGNORE_RETURN(artifacts_.Remove(sub.compiled_binary_path));
}

bool LifecycleManager::Resend_(Submission& sub, int64_t now) {
  if (sub.language == Language::HANDWRITTEN) {
    throw ValidationError("handwritten submissions are graded manually");
  }
  if (!sub.HasCode()) throw ValidationError("code has not been uploaded");
  RemoveOutputs_(sub);
  store_.ResetForRejudge(sub.id, now);
  sub.tasks.clear();
  sub.status = (int)Status::JUDGING;
  sub.score = sub.exec_time = sub.memory_usage = -1;
  sub.last_send = now;
  spdlog::info("Rejudging submission {}", sub.id);
  return dispatch_.Send(sub);
}

void LifecycleManager::SupersedeHandwritten_(const Submission& sub) {
  for (auto& old : store_.ListByProblem(sub.problem_id, SubmissionKind::FORMAL)) {
    if (old.id == sub.id || old.user != sub.user || old.language != Language::HANDWRITTEN) continue;
    for (auto& hw : catalog_.HomeworksOf(sub.problem_id)) {
      auto stat = gradebook_.FindHomeworkStatus(hw.homework_id, sub.user, sub.problem_id);
      if (!stat) continue;
      gradebook_.SaveHomeworkStatus(hw.homework_id, sub.user, sub.problem_id,
                                    HomeworkProblemStatus{.raw_score = stat->raw_score});
    }
    RemoveArtifacts_(old);
    if (store_.Remove(old.id)) {
      spdlog::info("Handwritten submission {} replaced by {}", old.id, sub.id);
    }
  }
}

bool LifecycleManager::Upload(const std::string& id, const std::string& code) {
  bool sent = dispatch_.Submit(id, code);
  auto sub = store_.Find(id);
  if (sub && sub->language == Language::HANDWRITTEN && !sub->IsTrial()) {
    SupersedeHandwritten_(*sub);
  }
  return sent;
}

void LifecycleManager::Grade(const std::string& id, int score) {
  if (score < 0 || score > 100) throw ValidationError("score must be between 0 to 100.");
  auto sub = store_.Find(id);
  if (!sub) throw NotFoundError(fmt::format("{} not found", id));
  if (sub->language != Language::HANDWRITTEN || sub->IsTrial()) {
    throw ValidationError("only formal handwritten submissions are graded manually");
  }
  if (!sub->HasCode()) throw ValidationError("code has not been uploaded");
  int status = (int)(score == 100 ? Status::AC : Status::WA);
  store_.StoreGrade(id, status, score);
  sub->status = status;
  sub->score = score;
  spdlog::info("Submission {} graded: status={} score={}", id, status, score);
  MakeJudgingPolicy(*sub, catalog_, gradebook_)->FinishJudging(*sub);
}

bool LifecycleManager::Rejudge(const std::string& id) {
  auto sub = store_.Find(id);
  if (!sub) throw NotFoundError(fmt::format("{} not found", id));
  int64_t now = clock_();
  if (sub->IsPending() || sub->IsJudging()) {
    int64_t age = now - sub->last_send;
    if (age < kRejudgeCooldown) {
      throw TryLaterError(sub->IsPending() ? "Submission has not been sent to judge yet, try later"
                                           : "Submission is still being judged, try later");
    }
    spdlog::warn("Submission {} has been {} for {} seconds, rejudging",
                 id, sub->IsPending() ? "pending" : "judging", age);
  }
  return Resend_(*sub, now);
}

RejudgeSummary LifecycleManager::RejudgeAll(int problem_id) {
  RejudgeSummary summary;
  int64_t now = clock_();
  for (auto& sub : store_.ListByProblem(problem_id, SubmissionKind::FORMAL)) {
    if (sub.IsPending() || sub.language == Language::HANDWRITTEN ||
        (sub.IsJudging() && now - sub.last_send < kRejudgeAllCooldown)) {
      summary.skipped++;
      continue;
    }
    try {
      if (Resend_(sub, now)) {
        summary.rejudged++;
      } else {
        summary.failed++;
      }
    } catch (const std::runtime_error& err) {
      spdlog::warn("Failed to rejudge submission {}: {}", sub.id, err.what());
      summary.failed++;
    }
  }
  spdlog::info("Rejudge of problem {}: {} sent, {} skipped, {} failed",
               problem_id, summary.rejudged, summary.skipped, summary.failed);
  return summary;
}

void LifecycleManager::Delete(const std::string& id) {
  auto sub = store_.Find(id);
  if (!sub) throw NotFoundError(fmt::format("{} not found", id));
  if (sub->IsJudging()) {
    int64_t age = clock_() - sub->last_send;
    if (age < kDeleteCooldown) throw ConflictError("Submission is still being judged");
    spdlog::warn("Deleting submission {} stuck in judging for {} seconds", id, age);
  }
  RemoveArtifacts_(*sub);
  if (!store_.Remove(id)) throw NotFoundError(fmt::format("{} not found", id));
  spdlog::info("Deleted submission {}", id);
}

size_t LifecycleManager::PurgeExpired() {
  size_t count = 0;
  for (auto& sub : store_.ListExpired(clock_())) {
    RemoveArtifacts_(sub);
    if (store_.Remove(sub.id)) count++;
  }
  if (count) spdlog::info("Purged {} expired trial submissions", count);
  return count;
}
