#include <noj/errors.h>
#include <noj/ingestion.h>

#include "utils.h"

using nlohmann::json;

namespace {

json Body(json tasks) {
  return json{{"tasks", std::move(tasks)}, {"token", "unused"}};
}

struct AggregateParam {
  std::string name;
  std::vector<std::vector<std::string>> statuses;
  int expect_status;
  int expect_score;
};

std::string ParamName(const ::testing::TestParamInfo<AggregateParam>& info) {
  return info.param.name;
}

} // namespace

class IngestionTest : public PipelineTest {
 protected:
  void Process(const std::string& id, const json& body) {
    ingestion->ProcessResult(id, ResultPayload::FromJson(body));
  }
};

class Aggregation : public IngestionTest, public testing::WithParamInterface<AggregateParam> {};
TEST_P(Aggregation, StatusAndScore) {
  auto& param = GetParam();
  SeedProblem();
  Submission sub = SeedSubmission("student");
  json tasks = json::array();
  for (auto& task : param.statuses) {
    json cases = json::array();
    for (auto& status : task) cases.push_back(CaseJson(status));
    tasks.push_back(cases);
  }
  Process(sub.id, Body(tasks));
  sub = Reload(sub.id);
  EXPECT_EQ(sub.status, param.expect_status);
  EXPECT_EQ(sub.score, param.expect_score);
  ASSERT_EQ(sub.tasks.size(), param.statuses.size());
}
INSTANTIATE_TEST_SUITE_P(Statuses, Aggregation,
    testing::Values(
      (AggregateParam){"AllAccepted", {{"AC", "AC"}, {"AC"}}, 0, 100},
      (AggregateParam){"SecondTaskWrong", {{"AC"}, {"AC", "WA"}}, 1, 40},
      (AggregateParam){"FirstTaskWrong", {{"TLE", "AC"}, {"AC"}}, 3, 60},
      (AggregateParam){"WorstWins", {{"RE", "WA"}, {"MLE", "OLE"}}, 7, 0},
      (AggregateParam){"CompileError", {{"CE"}, {"CE"}}, 2, 0},
      (AggregateParam){"NoTasks", {}, -3, 0},
      (AggregateParam){"EmptyTask", {{"AC"}, {}}, 0, 40}
    ),
    ParamName);

TEST_F(IngestionTest, TaskMetrics) {
  SeedProblem();
  Submission sub = SeedSubmission("student");
  Process(sub.id, Body(json::array({
    json::array({CaseJson("AC", 10, 300), CaseJson("WA", 25, 100)}),
    json::array(),
  })));
  sub = Reload(sub.id);
  ASSERT_EQ(sub.tasks.size(), 2u);
  EXPECT_EQ(sub.tasks[0].status, (int)Status::WA);
  EXPECT_EQ(sub.tasks[0].exec_time, 25);
  EXPECT_EQ(sub.tasks[0].memory_usage, 300);
  EXPECT_EQ(sub.tasks[0].score, 0);
  EXPECT_EQ(sub.tasks[1].status, (int)Status::UNRECOGNIZED);
  EXPECT_EQ(sub.tasks[1].exec_time, -1);
  EXPECT_EQ(sub.tasks[1].memory_usage, -1);
  EXPECT_EQ(sub.exec_time, 25);
  EXPECT_EQ(sub.memory_usage, 300);
}

TEST_F(IngestionTest, CaseOutputs) {
  SeedProblem();
  Submission sub = SeedSubmission("student");
  json missing = CaseJson("RE");
  missing.erase("stderr");
  Process(sub.id, Body(json::array({json::array({CaseJson("AC", 1, 1, "3\n", "warn"), missing})})));
  sub = Reload(sub.id);
  auto output = ReadCaseOutput(*artifacts, sub, 0, 0);
  EXPECT_EQ(output.stdout_text, "3\n");
  EXPECT_EQ(output.stderr_text, "warn");
  EXPECT_EQ(ReadCaseOutput(*artifacts, sub, 0, 1).stderr_text, "");
  EXPECT_EQ(sub.tasks[0].cases[0].output_path.rfind("submissions/task00_case00_", 0), 0u);
  EXPECT_THROW(ReadCaseOutput(*artifacts, sub, 0, 2), NotFoundError);
  EXPECT_THROW(ReadCaseOutput(*artifacts, sub, 1, 0), NotFoundError);
}

TEST_F(IngestionTest, InvalidTasks) {
  SeedProblem();
  Submission sub = SeedSubmission("student");
  EXPECT_THROW(Process(sub.id, Body("AC")), ValidationError);
  EXPECT_THROW(Process(sub.id, Body(json::array({json::array({{{"status", "AC"}}})}))),
               ValidationError);
  EXPECT_THROW(ResultPayload::FromJson(json{{"token", "x"}}), ValidationError);
  EXPECT_THROW(Process("ffff", Body(json::array())), NotFoundError);
  EXPECT_EQ(Reload(sub.id).status, (int)Status::PENDING);
}

TEST_F(IngestionTest, StatusOverride) {
  SeedProblem();
  Submission sub = SeedSubmission("student");
  json body = Body(json::array({json::array({CaseJson("WA")})}));
  body["statusOverride"] = "AC";
  Process(sub.id, body);
  EXPECT_EQ(Reload(sub.id).status, (int)Status::AC);

  // unknown names keep the computed status
  body["statusOverride"] = "Bogus";
  Process(sub.id, body);
  EXPECT_EQ(Reload(sub.id).status, (int)Status::WA);
}

TEST_F(IngestionTest, ScoringOverrides) {
  SeedProblem();
  Submission sub = SeedSubmission("student");
  json body = Body(json::array({json::array({CaseJson("AC")}), json::array({CaseJson("AC")})}));
  body["statusOverride"] = "WA";
  body["scoring"] = {
    {"status", "JE"},
    {"score", "37"},
    {"message", "partial"},
    {"breakdown", {{"style", 7}}},
    {"artifacts", {{"stdout", "scorer log"}}},
  };
  Process(sub.id, body);
  sub = Reload(sub.id);
  EXPECT_EQ(sub.status, (int)Status::JE);
  EXPECT_EQ(sub.score, 37);
  EXPECT_EQ(sub.scoring_message, "partial");
  EXPECT_EQ(sub.scoring_breakdown, json({{"style", 7}}));
  EXPECT_EQ(artifacts->Get(sub.scorer_artifacts_path), "scorer log");

  body["scoring"] = {{"score", "many"}, {"breakdown", json::array({1})},
                     {"artifacts", {{"scorerPath", "scorer/given.txt"}}}};
  Process(sub.id, body);
  sub = Reload(sub.id);
  EXPECT_EQ(sub.status, (int)Status::WA);
  EXPECT_EQ(sub.score, 0);
  EXPECT_TRUE(sub.scoring_breakdown.is_null());
  EXPECT_EQ(sub.scorer_artifacts_path, "scorer/given.txt");
}

TEST_F(IngestionTest, StaticAnalysis) {
  SeedProblem();
  Submission sub = SeedSubmission("student");
  json body = Body(json::array({json::array({CaseJson("AC")})}));
  body["staticAnalysis"] = {{"status", "FAIL"}, {"message", "banned call"}, {"report", "uses goto"}};
  Process(sub.id, body);
  sub = Reload(sub.id);
  EXPECT_EQ(sub.sa_status, 1);
  EXPECT_EQ(sub.sa_message, "banned call");
  EXPECT_EQ(sub.sa_report_path.rfind("static-analysis/" + sub.id + "_", 0), 0u);
  EXPECT_EQ(artifacts->Get(sub.sa_report_path), "uses goto");

  // non-ASCII bytes are compared as they are
  body["staticAnalysis"] = {{"status", "PASS\u00c9"}};
  Process(sub.id, body);
  EXPECT_EQ(Reload(sub.id).sa_status, 1);

  body["staticAnalysis"] = {{"status", "pass"}, {"report", "ok"}, {"reportPath", "sa/given.txt"}};
  Process(sub.id, body);
  sub = Reload(sub.id);
  EXPECT_EQ(sub.sa_status, 0);
  EXPECT_EQ(sub.sa_report_path, "sa/given.txt");

  body["staticAnalysis"] = {{"status", "skip"}};
  Process(sub.id, body);
  EXPECT_EQ(Reload(sub.id).sa_status, std::nullopt);

  body.erase("staticAnalysis");
  Process(sub.id, body);
  sub = Reload(sub.id);
  EXPECT_EQ(sub.sa_status, std::nullopt);
  EXPECT_EQ(sub.sa_message, "");
  EXPECT_EQ(sub.sa_report_path, "");
}

TEST_F(IngestionTest, CheckerSummary) {
  SeedProblem();
  Submission sub = SeedSubmission("student");
  json body = Body(json::array({json::array({CaseJson("AC")})}));
  body["checker"] = {
    {"messages", json::array({
      {{"case", 3}, {"status", "WA"}, {"message", "  expected 4 \n"}},
      {{"case", 4}, {"status", "AC"}, {"message", ""}},
      {{"message", "check done"}},
    })},
    {"artifacts", {{"checkResult", "full diff"}}},
  };
  Process(sub.id, body);
  sub = Reload(sub.id);
  EXPECT_EQ(sub.checker_summary, "3: [WA] expected 4\ncheck done");
  EXPECT_EQ(artifacts->Get(sub.checker_artifacts_path), "full diff");
}

TEST_F(IngestionTest, FormalBookkeeping) {
  SeedProblem();
  Submission sub = SeedSubmission("student");
  Process(sub.id, Body(json::array({json::array({CaseJson("AC")}), json::array({CaseJson("AC")})})));
  EXPECT_EQ(db->AcceptedProblems("student"), std::vector<int>{1});
  EXPECT_EQ(db->TrialCount(1, "student"), 0);
}

TEST_F(IngestionTest, TrialScoresZero) {
  SeedProblem();
  Submission sub = SeedSubmission("student", SubmissionKind::TRIAL);
  Process(sub.id, Body(json::array({json::array({CaseJson("AC")}), json::array({CaseJson("AC")})})));
  sub = Reload(sub.id);
  EXPECT_EQ(sub.status, (int)Status::AC);
  EXPECT_EQ(sub.score, 0);
  EXPECT_EQ(sub.tasks[0].cases[0].output_path.rfind("trial_submissions/", 0), 0u);
  EXPECT_EQ(db->TrialCount(1, "student"), 1);
  EXPECT_TRUE(db->AcceptedProblems("student").empty());
}

TEST_F(IngestionTest, HomeworkPenalty) {
  SeedProblem();
  db->UpsertHomework({1, "course", kTime - 1000, kTime - 100, {1}, {"student"}, 20});
  db->UpsertHomework({2, "course", kTime - 1000, kTime - 100, {1}, {"classmate"}, std::nullopt});
  Submission sub = SeedSubmission("student");
  EXPECT_EQ(ingestion->LateSeconds(sub), 100);
  Process(sub.id, Body(json::array({json::array({CaseJson("AC")}), json::array({CaseJson("AC")})})));

  auto stat = db->FindHomeworkStatus(1, "student", 1);
  ASSERT_TRUE(stat);
  EXPECT_EQ(stat->score, 80);
  EXPECT_EQ(stat->raw_score, 100);
  EXPECT_EQ(stat->problem_status, (int)Status::AC);
  EXPECT_EQ(stat->submission_ids, std::vector<std::string>{sub.id});
  EXPECT_FALSE(db->FindHomeworkStatus(2, "student", 1));

  // a lower score does not replace the stored one
  Submission second = SeedSubmission("student");
  Process(second.id, Body(json::array({json::array({CaseJson("WA")}), json::array({CaseJson("AC")})})));
  stat = db->FindHomeworkStatus(1, "student", 1);
  EXPECT_EQ(stat->score, 80);
  EXPECT_EQ(stat->submission_ids.size(), 2u);
}

TEST_F(IngestionTest, LeastLateHomeworkDecides) {
  SeedProblem();
  db->UpsertHomework({1, "course", kTime - 1000, kTime - 100, {1}, {"student"}, 50});
  db->UpsertHomework({2, "course", kTime - 1000, kTime + 100, {1}, {"student"}, std::nullopt});
  Submission sub = SeedSubmission("student");
  EXPECT_EQ(ingestion->LateSeconds(sub), 0);
  Process(sub.id, Body(json::array({json::array({CaseJson("AC")}), json::array({CaseJson("AC")})})));
  EXPECT_EQ(db->FindHomeworkStatus(1, "student", 1)->score, 100);
  EXPECT_EQ(db->FindHomeworkStatus(2, "student", 1)->score, 100);
}

TEST_F(IngestionTest, OnlyLeastLateHomeworkPenalizes) {
  SeedProblem();
  db->UpsertHomework({1, "course", kTime - 1000, kTime - 100, {1}, {"student"}, 20});
  db->UpsertHomework({2, "course", kTime - 1000, kTime - 500, {1}, {"student"}, 50});
  Submission sub = SeedSubmission("student");
  EXPECT_EQ(ingestion->LateSeconds(sub), 100);
  Process(sub.id, Body(json::array({json::array({CaseJson("AC")}), json::array({CaseJson("AC")})})));
  EXPECT_EQ(db->FindHomeworkStatus(1, "student", 1)->score, 80);
  auto stat = db->FindHomeworkStatus(2, "student", 1);
  EXPECT_EQ(stat->score, 100);
  EXPECT_EQ(stat->raw_score, 100);
}

TEST_F(IngestionTest, LateSecondsWithoutHomework) {
  SeedProblem();
  Submission sub = SeedSubmission("student");
  EXPECT_EQ(ingestion->LateSeconds(sub), -1);
}
