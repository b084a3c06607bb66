#include "judging_policy.h"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace {

bool HasStudent(const Homework& hw, const std::string& user) {
  return std::find(hw.students.begin(), hw.students.end(), user) != hw.students.end();
}

} // namespace

std::optional<Lateness> LeastLateHomework(Catalog& catalog, const Submission& sub) {
  std::optional<Lateness> ret;
  for (auto& hw : catalog.HomeworksOf(sub.problem_id)) {
    if (!HasStudent(hw, sub.user)) continue;
    long late = std::max<long>(0, sub.timestamp - hw.end);
    if (!ret || late < ret->seconds) ret = Lateness{hw.homework_id, late};
  }
  return ret;
}

long LateSeconds(Catalog& catalog, const Submission& sub) {
  auto least = LeastLateHomework(catalog, sub);
  return least ? least->seconds : -1;
}

int FormalPolicy::TaskScore(size_t task, int status) {
  if (status != (int)Status::AC) return 0;
  if (!problem_ || task >= problem_->task_scores.size()) {
    spdlog::warn("No point value for task {} of problem {}", task,
                 problem_ ? problem_->problem_id : -1);
    return 0;
  }
  return problem_->task_scores[task];
}

void FormalPolicy::FinishJudging(const Submission& sub) {
  gradebook_.RecordSubmission(sub.user, sub.problem_id, sub.id, sub.status == (int)Status::AC);
  UpdateHomeworks_(sub);
}

void FormalPolicy::UpdateHomeworks_(const Submission& sub) {
  bool handwritten = sub.language == Language::HANDWRITTEN;
  // only the least late homework may penalize
  auto least = LeastLateHomework(catalog_, sub);
  for (auto& hw : catalog_.HomeworksOf(sub.problem_id)) {
    auto stat = gradebook_.FindHomeworkStatus(hw.homework_id, sub.user, sub.problem_id);
    if (!stat) {
      spdlog::warn("Submission {} not in homework {} [user={}, problem={}]",
                   sub.id, hw.homework_id, sub.user, sub.problem_id);
      continue;
    }
    stat->raw_score = std::max(stat->raw_score, sub.score);
    if (handwritten) {
      // graded by hand; the latest grade stands
      stat->submission_ids = {sub.id};
      stat->score = sub.score;
      stat->problem_status = sub.status;
      gradebook_.SaveHomeworkStatus(hw.homework_id, sub.user, sub.problem_id, *stat);
      continue;
    }
    stat->submission_ids.push_back(sub.id);
    int score = sub.score;
    if (least && least->homework_id == hw.homework_id && least->seconds > 0 && hw.penalty) {
      score = sub.score * (100 - std::clamp(*hw.penalty, 0, 100)) / 100;
      spdlog::info("Submission {} is {}s late for homework {}, score {} -> {}",
                   sub.id, least->seconds, hw.homework_id, sub.score, score);
    }
    if (score >= stat->score) {
      stat->score = score;
      stat->problem_status = sub.status;
    }
    gradebook_.SaveHomeworkStatus(hw.homework_id, sub.user, sub.problem_id, *stat);
  }
}

void TrialPolicy::FinishJudging(const Submission& sub) {
  gradebook_.IncrementTrialCount(sub.problem_id, sub.user);
}

std::unique_ptr<JudgingPolicy> MakeJudgingPolicy(const Submission& sub, Catalog& catalog,
                                                 Gradebook& gradebook) {
  if (sub.IsTrial()) return std::make_unique<TrialPolicy>(gradebook);
  return std::make_unique<FormalPolicy>(catalog, gradebook, sub.problem_id);
}
