#include "noj/paths.h"

#include <fmt/format.h>

#include "utils.h"

fs::path kDataDir = fs::path(NOJ_DATA_DIR);

fs::path DatabasePath() {
  return kDataDir / "noj.db";
}

fs::path ArtifactRoot() {
  return kDataDir / "artifacts";
}

std::string CodeObjectName() {
  return fmt::format("submissions/{}.zip", RandomId());
}

std::string CustomInputObjectName() {
  return fmt::format("trial_inputs/{}.zip", RandomId());
}

std::string CaseOutputObjectName(SubmissionKind kind, int task, int test_case) {
  const char* prefix = kind == SubmissionKind::TRIAL ? "trial_submissions" : "submissions";
  return fmt::format("{}/task{:02d}_case{:02d}_{}.zst", prefix, task, test_case, RandomId());
}

std::string StaticAnalysisObjectName(const std::string& submission_id) {
  return fmt::format("static-analysis/{}_{}.txt", submission_id, RandomId());
}

std::string CheckerObjectName(const std::string& submission_id) {
  return fmt::format("checker/{}_{}.txt", submission_id, RandomId());
}

std::string ScorerObjectName(const std::string& submission_id) {
  return fmt::format("scorer/{}_{}.txt", submission_id, RandomId());
}

std::string TrialErrorObjectName(const std::string& submission_id) {
  return fmt::format("trial/{}/error_output.zst", submission_id);
}

std::string CompiledBinaryObjectName(SubmissionKind kind, const std::string& submission_id) {
  const char* prefix = kind == SubmissionKind::TRIAL ? "trial_compiled_binaries" : "compiled_binaries";
  return fmt::format("{}/{}", prefix, submission_id);
}
