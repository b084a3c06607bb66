#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <memory>
#include <vector>
#include <utility>
#include <filesystem>

#include <gtest/gtest.h>
#include <noj/cache.h>
#include <noj/database.h>
#include <noj/dispatch.h>
#include <noj/ingestion.h>
#include <noj/lifecycle.h>
#include <noj/capability.h>
#include <noj/token_broker.h>
#include <noj/artifact_store.h>

#include "memory_cache.h"

namespace fs = std::filesystem;

constexpr int64_t kTime = 1655000000;

fs::path ScratchDir();

// Builds a zip archive; deflate=false stores the entries uncompressed.
std::string MakeZip(const std::vector<std::pair<std::string, std::string>>& files,
                    bool deflate = false);
std::string MainZip(Language lang, const std::string& content = "int main() {}");
std::string PdfZip();

// One case of a worker callback.
nlohmann::json CaseJson(const std::string& status, long exec_time = 10, long memory_usage = 1024,
                        const std::string& out = "out", const std::string& err = "");

// A fresh database and artifact store per test, wired like the server does.
class PipelineTest : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  // problem 1 in course "course" owned by "teacher", two tasks worth 40 and 60
  ProblemInfo SeedProblem(int problem_id = 1);
  Submission SeedSubmission(const std::string& user, SubmissionKind = SubmissionKind::FORMAL,
                            int problem_id = 1, Language = Language::CPP);
  Submission Reload(const std::string& id);
  // points the dispatcher at a single worker; the worker must answer /status
  void UseWorker(const std::string& url);

  int seeded = 0;

  int64_t now = kTime;
  fs::path dir;
  std::unique_ptr<Database> db;
  std::unique_ptr<ArtifactStore> artifacts;
  std::unique_ptr<MemoryCache> cache;
  std::unique_ptr<TokenBroker> tokens;
  std::unique_ptr<CapabilityEngine> capabilities;
  std::unique_ptr<DispatchCoordinator> dispatch;
  std::unique_ptr<ResultIngestion> ingestion;
  std::unique_ptr<LifecycleManager> lifecycle;
};

#endif // TEST_UTILS_H_
