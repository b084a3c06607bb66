#include <noj/errors.h>
#include <noj/lifecycle.h>

#include "utils.h"
#include "fake_worker.h"

class LifecycleTest : public PipelineTest {
 protected:
  CreateRequest Request(const std::string& user, SubmissionKind kind = SubmissionKind::FORMAL) {
    return CreateRequest{{user}, 1, Language::CPP, kind, "10.0.0.1"};
  }

  void AllowHandwritten() {
    ProblemInfo problem = SeedProblem();
    problem.allowed_languages |= 1 << (int)Language::HANDWRITTEN;
    db->UpsertProblem(problem);
  }

  Submission Handwritten(const std::string& user) {
    return SeedSubmission(user, SubmissionKind::FORMAL, 1, Language::HANDWRITTEN);
  }

  // a formal submission judged by the fake worker
  Submission Judged(FakeWorker& worker) {
    Submission sub = lifecycle->Create(Request("student"));
    EXPECT_TRUE(dispatch->Submit(sub.id, MainZip(Language::CPP)));
    std::string token = worker.Jobs().back().fields["token"];
    nlohmann::json body{
      {"tasks", nlohmann::json::array({
        nlohmann::json::array({CaseJson("AC")}),
        nlohmann::json::array({CaseJson("AC")}),
      })},
      {"token", token},
    };
    EXPECT_TRUE(tokens->Verify(sub.id, token));
    ingestion->ProcessResult(sub.id, ResultPayload::FromJson(body));
    return Reload(sub.id);
  }
};

TEST_F(LifecycleTest, CreateDefaults) {
  SeedProblem();
  Submission sub = lifecycle->Create(Request("student"));
  EXPECT_EQ(sub.id.size(), 32u);
  sub = Reload(sub.id);
  EXPECT_EQ(sub.status, (int)Status::PENDING);
  EXPECT_EQ(sub.score, -1);
  EXPECT_EQ(sub.exec_time, -1);
  EXPECT_EQ(sub.memory_usage, -1);
  EXPECT_EQ(sub.timestamp, kTime);
  EXPECT_EQ(sub.last_send, kTime);
  EXPECT_EQ(sub.ip_addr, "10.0.0.1");
  EXPECT_EQ(sub.expire_at, 0);
  EXPECT_EQ(db->LastSubmit("student"), kTime);
}

TEST_F(LifecycleTest, CreateRejections) {
  ProblemInfo problem = SeedProblem();
  problem.allowed_languages = 1 << (int)Language::PYTHON;
  db->UpsertProblem(problem);
  EXPECT_THROW(lifecycle->Create(Request("student")), ValidationError);
  CreateRequest req = Request("student");
  req.problem_id = 2;
  EXPECT_THROW(lifecycle->Create(req), NotFoundError);
  req = Request("stranger");
  req.language = Language::PYTHON;
  EXPECT_THROW(lifecycle->Create(req), PermissionError);
}

TEST_F(LifecycleTest, RateLimit) {
  SeedProblem();
  SubmissionConfig config = dispatch->Config();
  config.rate_limit = 10;
  dispatch = std::make_unique<DispatchCoordinator>(*db, *artifacts, *tokens, config,
                                                   [this]() { return now; });
  lifecycle = std::make_unique<LifecycleManager>(*db, *artifacts, *dispatch, *db, *db,
                                                 [this]() { return now; });
  lifecycle->Create(Request("student"));
  now += 4;
  try {
    lifecycle->Create(Request("student"));
    FAIL() << "expected RateLimitError";
  } catch (const RateLimitError& err) {
    EXPECT_EQ(err.WaitFor(), 6);
  }
  // graders are not limited
  EXPECT_NO_THROW(lifecycle->Create(Request("ta")));
  now += 6;
  EXPECT_NO_THROW(lifecycle->Create(Request("student")));
}

TEST_F(LifecycleTest, DailyQuota) {
  ProblemInfo problem = SeedProblem();
  problem.quota = 2;
  db->UpsertProblem(problem);
  lifecycle->Create(Request("student"));
  lifecycle->Create(Request("student"));
  EXPECT_THROW(lifecycle->Create(Request("student")), PermissionError);
  EXPECT_NO_THROW(lifecycle->Create(Request("teacher")));
  EXPECT_EQ(db->FindQuota("student", 1).submit_count, 2);
  // the counter resets on the next day
  now += 86400;
  EXPECT_NO_THROW(lifecycle->Create(Request("student")));
  EXPECT_EQ(db->FindQuota("student", 1).submit_count, 1);
}

TEST_F(LifecycleTest, TrialCreation) {
  ProblemInfo problem = SeedProblem();
  EXPECT_THROW(lifecycle->Create(Request("student", SubmissionKind::TRIAL)), PermissionError);
  problem.trial_mode = true;
  problem.trial_quota = 1;
  db->UpsertProblem(problem);
  Submission sub = lifecycle->Create(Request("student", SubmissionKind::TRIAL));
  EXPECT_EQ(Reload(sub.id).expire_at, kTime + kDefaultTrialTtl);
  db->IncrementTrialCount(1, "student");
  EXPECT_THROW(lifecycle->Create(Request("student", SubmissionKind::TRIAL)), PermissionError);
  EXPECT_NO_THROW(lifecycle->Create(Request("ta", SubmissionKind::TRIAL)));
}

TEST_F(LifecycleTest, RejudgeCooldown) {
  SeedProblem();
  FakeWorker worker;
  UseWorker(worker.Url());
  Submission pending = lifecycle->Create(Request("student"));
  EXPECT_THROW(lifecycle->Rejudge(pending.id), TryLaterError);
  ASSERT_TRUE(dispatch->Submit(pending.id, MainZip(Language::CPP)));
  now += kRejudgeCooldown - 1;
  EXPECT_THROW(lifecycle->Rejudge(pending.id), TryLaterError);
  now += 1;
  // a stale judging submission may be rejudged
  EXPECT_TRUE(lifecycle->Rejudge(pending.id));
  EXPECT_EQ(Reload(pending.id).last_send, now);
  EXPECT_EQ(worker.Jobs().size(), 2u);
}

TEST_F(LifecycleTest, RejudgeClearsResults) {
  SeedProblem();
  FakeWorker worker;
  UseWorker(worker.Url());
  Submission sub = Judged(worker);
  ASSERT_EQ(sub.status, (int)Status::AC);
  std::string output = sub.tasks[0].cases[0].output_path;
  ASSERT_TRUE(artifacts->Exists(output));

  EXPECT_TRUE(lifecycle->Rejudge(sub.id));
  sub = Reload(sub.id);
  EXPECT_EQ(sub.status, (int)Status::JUDGING);
  EXPECT_EQ(sub.score, -1);
  EXPECT_TRUE(sub.tasks.empty());
  EXPECT_FALSE(artifacts->Exists(output));
  // the new dispatch carries a fresh token
  auto jobs = worker.Jobs();
  ASSERT_EQ(jobs.size(), 2u);
  EXPECT_NE(jobs[0].fields["token"], jobs[1].fields["token"]);
  EXPECT_TRUE(tokens->Verify(sub.id, jobs[1].fields["token"]));
}

TEST_F(LifecycleTest, RejudgeWithoutCode) {
  SeedProblem();
  Submission sub = lifecycle->Create(Request("student"));
  now += kRejudgeCooldown;
  EXPECT_THROW(lifecycle->Rejudge(sub.id), ValidationError);
  EXPECT_THROW(lifecycle->Rejudge("ffff"), NotFoundError);
}

TEST_F(LifecycleTest, RejudgeAll) {
  SeedProblem();
  FakeWorker worker;
  UseWorker(worker.Url());
  Submission judged = Judged(worker);
  Submission pending = lifecycle->Create(Request("teacher"));
  Submission judging = lifecycle->Create(Request("ta"));
  ASSERT_TRUE(dispatch->Submit(judging.id, MainZip(Language::CPP)));
  Submission trial = SeedSubmission("student", SubmissionKind::TRIAL);

  auto summary = lifecycle->RejudgeAll(1);
  EXPECT_EQ(summary.rejudged, 1);
  EXPECT_EQ(summary.skipped, 2);
  EXPECT_EQ(summary.failed, 0);
  EXPECT_EQ(Reload(judged.id).status, (int)Status::JUDGING);
  EXPECT_EQ(Reload(pending.id).status, (int)Status::PENDING);
  EXPECT_EQ(Reload(trial.id).status, (int)Status::PENDING);

  now += kRejudgeAllCooldown;
  summary = lifecycle->RejudgeAll(1);
  EXPECT_EQ(summary.rejudged, 2);
  EXPECT_EQ(summary.skipped, 1);
}

TEST_F(LifecycleTest, HandwrittenIsNotRejudged) {
  AllowHandwritten();
  FakeWorker worker;
  UseWorker(worker.Url());
  Submission sub = Handwritten("student");
  ASSERT_TRUE(lifecycle->Upload(sub.id, PdfZip()));
  now += kRejudgeCooldown;
  EXPECT_THROW(lifecycle->Rejudge(sub.id), ValidationError);
  auto summary = lifecycle->RejudgeAll(1);
  EXPECT_EQ(summary.rejudged, 0);
  EXPECT_EQ(summary.skipped, 1);
  EXPECT_EQ(summary.failed, 0);
  sub = Reload(sub.id);
  EXPECT_EQ(sub.status, (int)Status::JUDGING);
  EXPECT_EQ(sub.last_send, kTime);
  EXPECT_FALSE(dispatch->Send(sub));
  EXPECT_TRUE(worker.Jobs().empty());
}

TEST_F(LifecycleTest, GradeHandwritten) {
  AllowHandwritten();
  db->UpsertHomework({1, "course", kTime - 1000, kTime - 100, {1}, {"student"}, 50});
  Submission sub = Handwritten("student");
  EXPECT_THROW(lifecycle->Grade(sub.id, 90), ValidationError);
  ASSERT_TRUE(lifecycle->Upload(sub.id, PdfZip()));
  EXPECT_THROW(lifecycle->Grade(sub.id, 101), ValidationError);
  EXPECT_THROW(lifecycle->Grade(sub.id, -1), ValidationError);
  EXPECT_THROW(lifecycle->Grade("ffff", 90), NotFoundError);

  lifecycle->Grade(sub.id, 90);
  sub = Reload(sub.id);
  EXPECT_EQ(sub.status, (int)Status::WA);
  EXPECT_EQ(sub.score, 90);
  // no late penalty on manual grades
  auto stat = db->FindHomeworkStatus(1, "student", 1);
  ASSERT_TRUE(stat);
  EXPECT_EQ(stat->score, 90);
  EXPECT_EQ(stat->problem_status, (int)Status::WA);
  EXPECT_EQ(stat->submission_ids, std::vector<std::string>{sub.id});

  lifecycle->Grade(sub.id, 100);
  EXPECT_EQ(Reload(sub.id).status, (int)Status::AC);
  EXPECT_EQ(db->AcceptedProblems("student"), std::vector<int>{1});
  // a lower regrade still stands
  lifecycle->Grade(sub.id, 70);
  stat = db->FindHomeworkStatus(1, "student", 1);
  EXPECT_EQ(stat->score, 70);
  EXPECT_EQ(stat->raw_score, 100);
  EXPECT_EQ(stat->submission_ids.size(), 1u);

  Submission code = SeedSubmission("student");
  EXPECT_THROW(lifecycle->Grade(code.id, 50), ValidationError);
}

TEST_F(LifecycleTest, HandwrittenResubmissionReplacesOlder) {
  AllowHandwritten();
  db->UpsertHomework({1, "course", kTime - 1000, kTime + 1000, {1}, {"student"}, std::nullopt});
  Submission first = Handwritten("student");
  ASSERT_TRUE(lifecycle->Upload(first.id, PdfZip()));
  lifecycle->Grade(first.id, 80);
  std::string first_code = Reload(first.id).code_path;
  Submission other = Handwritten("classmate");
  ASSERT_TRUE(lifecycle->Upload(other.id, PdfZip()));
  Submission program = SeedSubmission("student");

  Submission second = Handwritten("student");
  ASSERT_TRUE(lifecycle->Upload(second.id, PdfZip()));
  EXPECT_FALSE(db->Find(first.id));
  EXPECT_FALSE(artifacts->Exists(first_code));
  EXPECT_TRUE(db->Find(second.id));
  EXPECT_TRUE(db->Find(other.id));
  EXPECT_TRUE(db->Find(program.id));
  auto stat = db->FindHomeworkStatus(1, "student", 1);
  ASSERT_TRUE(stat);
  EXPECT_EQ(stat->score, 0);
  EXPECT_EQ(stat->problem_status, -1);
  EXPECT_TRUE(stat->submission_ids.empty());
  EXPECT_EQ(stat->raw_score, 80);
}

TEST_F(LifecycleTest, DeleteCooldown) {
  SeedProblem();
  FakeWorker worker;
  UseWorker(worker.Url());
  Submission sub = lifecycle->Create(Request("student"));
  ASSERT_TRUE(dispatch->Submit(sub.id, MainZip(Language::CPP)));
  std::string code_path = Reload(sub.id).code_path;
  now += kDeleteCooldown - 1;
  EXPECT_THROW(lifecycle->Delete(sub.id), ConflictError);
  now += 1;
  lifecycle->Delete(sub.id);
  EXPECT_FALSE(db->Find(sub.id));
  EXPECT_FALSE(artifacts->Exists(code_path));
  EXPECT_THROW(lifecycle->Delete(sub.id), NotFoundError);
}

TEST_F(LifecycleTest, DeleteJudged) {
  SeedProblem();
  FakeWorker worker;
  UseWorker(worker.Url());
  Submission sub = Judged(worker);
  std::string output = sub.tasks[1].cases[0].output_path;
  lifecycle->Delete(sub.id);
  EXPECT_FALSE(db->Find(sub.id));
  EXPECT_FALSE(artifacts->Exists(output));
}

TEST_F(LifecycleTest, PurgeExpired) {
  ProblemInfo problem = SeedProblem();
  problem.trial_mode = true;
  db->UpsertProblem(problem);
  Submission trial = lifecycle->Create(Request("student", SubmissionKind::TRIAL));
  Submission formal = lifecycle->Create(Request("student"));
  now += kDefaultTrialTtl - 1;
  EXPECT_EQ(lifecycle->PurgeExpired(), 0u);
  now += 1;
  EXPECT_EQ(lifecycle->PurgeExpired(), 1u);
  EXPECT_FALSE(db->Find(trial.id));
  EXPECT_TRUE(db->Find(formal.id));
}
