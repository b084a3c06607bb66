#ifndef INCLUDE_NOJ_PATHS_H_
#define INCLUDE_NOJ_PATHS_H_

#include <string>
#include <filesystem>

#include "submission.h"

namespace fs = std::filesystem;

// root of the database and the artifact store
extern fs::path kDataDir;

fs::path DatabasePath();
fs::path ArtifactRoot();

// object names inside the artifact store; each call generates a fresh name
std::string CodeObjectName();
std::string CustomInputObjectName();
std::string CaseOutputObjectName(SubmissionKind, int task, int test_case);
std::string StaticAnalysisObjectName(const std::string& submission_id);
std::string CheckerObjectName(const std::string& submission_id);
std::string ScorerObjectName(const std::string& submission_id);
std::string TrialErrorObjectName(const std::string& submission_id);
// fixed per submission; a new upload replaces the previous binary
std::string CompiledBinaryObjectName(SubmissionKind, const std::string& submission_id);

#endif  // INCLUDE_NOJ_PATHS_H_
