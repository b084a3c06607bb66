#include "utils.h"

#include <unistd.h>
#include <zlib.h>

#include <fmt/format.h>
#include <noj/paths.h>
#include <noj/utils.h>

namespace {

void Put16(std::string& out, uint16_t val) {
  out.push_back(val & 0xff);
  out.push_back(val >> 8);
}

void Put32(std::string& out, uint32_t val) {
  Put16(out, val & 0xffff);
  Put16(out, val >> 16);
}

std::string RawDeflate(const std::string& data) {
  z_stream strm{};
  deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
  std::string ret(deflateBound(&strm, data.size()), '\0');
  strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  strm.avail_in = data.size();
  strm.next_out = reinterpret_cast<Bytef*>(ret.data());
  strm.avail_out = ret.size();
  deflate(&strm, Z_FINISH);
  ret.resize(ret.size() - strm.avail_out);
  deflateEnd(&strm);
  return ret;
}

} // namespace

fs::path ScratchDir() {
  return fs::temp_directory_path() / fmt::format("noj-test-{}", getpid());
}

std::string MakeZip(const std::vector<std::pair<std::string, std::string>>& files, bool deflate) {
  std::string out, dir;
  for (auto& [name, content] : files) {
    uint32_t crc = crc32(0, reinterpret_cast<const Bytef*>(content.data()), content.size());
    std::string body = deflate ? RawDeflate(content) : content;
    uint16_t method = deflate ? 8 : 0;
    uint32_t offset = out.size();

    Put32(out, 0x04034b50);
    Put16(out, 20); Put16(out, 0); Put16(out, method);
    Put16(out, 0); Put16(out, 0x21);
    Put32(out, crc); Put32(out, body.size()); Put32(out, content.size());
    Put16(out, name.size()); Put16(out, 0);
    out += name;
    out += body;

    Put32(dir, 0x02014b50);
    Put16(dir, 20); Put16(dir, 20); Put16(dir, 0); Put16(dir, method);
    Put16(dir, 0); Put16(dir, 0x21);
    Put32(dir, crc); Put32(dir, body.size()); Put32(dir, content.size());
    Put16(dir, name.size()); Put16(dir, 0); Put16(dir, 0);
    Put16(dir, 0); Put16(dir, 0); Put32(dir, 0);
    Put32(dir, offset);
    dir += name;
  }
  uint32_t dir_offset = out.size();
  out += dir;
  Put32(out, 0x06054b50);
  Put16(out, 0); Put16(out, 0);
  Put16(out, files.size()); Put16(out, files.size());
  Put32(out, dir.size()); Put32(out, dir_offset);
  Put16(out, 0);
  return out;
}

std::string MainZip(Language lang, const std::string& content) {
  return MakeZip({{std::string("main") + LanguageExtension(lang), content}});
}

std::string PdfZip() {
  return MakeZip({{"main.pdf", "%PDF-1.4\n%\xe2\xe3\xcf\xd3\n"}}, true);
}

nlohmann::json CaseJson(const std::string& status, long exec_time, long memory_usage,
                        const std::string& out, const std::string& err) {
  return nlohmann::json{
    {"status", status},
    {"execTime", exec_time},
    {"memoryUsage", memory_usage},
    {"stdout", out},
    {"stderr", err},
    {"exitCode", 0},
  };
}

void PipelineTest::SetUp() {
  const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
  std::string name = fmt::format("{}.{}", info->test_suite_name(), info->name());
  for (auto& c : name) {
    if (c == '/') c = '_';
  }
  dir = kDataDir / name;
  fs::remove_all(dir);
  fs::create_directories(dir);

  Clock clock = [this]() { return now; };
  db = std::make_unique<Database>(dir / "noj.db");
  artifacts = std::make_unique<ArtifactStore>(dir / "artifacts");
  cache = std::make_unique<MemoryCache>(clock);
  tokens = std::make_unique<TokenBroker>(*cache);
  capabilities = std::make_unique<CapabilityEngine>(*db, *cache, 0);
  SubmissionConfig config;
  config.workers = {{"Sandbox-0", "http://127.0.0.1:1", "worker-secret"}};
  dispatch = std::make_unique<DispatchCoordinator>(*db, *artifacts, *tokens, config, clock);
  ingestion = std::make_unique<ResultIngestion>(*db, *artifacts, *db, *db);
  lifecycle = std::make_unique<LifecycleManager>(*db, *artifacts, *dispatch, *db, *db, clock);
  dispatch->SetReporter({
    .ReportDispatchFailure = [this](const Submission& sub, const std::string& msg, Status status) {
      ingestion->RecordDispatchFailure(sub, msg, status);
    },
  });
}

void PipelineTest::TearDown() {
  lifecycle.reset();
  ingestion.reset();
  dispatch.reset();
  capabilities.reset();
  tokens.reset();
  cache.reset();
  artifacts.reset();
  db.reset();
  fs::remove_all(dir);
}

ProblemInfo PipelineTest::SeedProblem(int problem_id) {
  ProblemInfo problem{
    .problem_id = problem_id,
    .owner = "teacher",
    .courses = {"course"},
    .task_scores = {40, 60},
  };
  db->UpsertProblem(problem);
  db->SetRole("course", "teacher", CourseRole::TEACHER);
  db->SetRole("course", "ta", CourseRole::TA);
  db->SetRole("course", "student", CourseRole::STUDENT);
  db->SetRole("course", "classmate", CourseRole::STUDENT);
  return problem;
}

Submission PipelineTest::SeedSubmission(const std::string& user, SubmissionKind kind,
                                        int problem_id, Language lang) {
  Submission sub;
  sub.id = fmt::format("{:032x}", ++seeded);
  sub.kind = kind;
  sub.problem_id = problem_id;
  sub.user = user;
  sub.language = lang;
  sub.timestamp = sub.last_send = now;
  db->Insert(sub);
  return sub;
}

Submission PipelineTest::Reload(const std::string& id) {
  auto sub = db->Find(id);
  EXPECT_TRUE(sub.has_value()) << id;
  return sub.value_or(Submission());
}

void PipelineTest::UseWorker(const std::string& url) {
  SubmissionConfig config;
  config.workers = {{"Sandbox-0", url, "worker-secret"}};
  dispatch->UpdateConfig(config);
}
