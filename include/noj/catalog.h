#ifndef INCLUDE_NOJ_CATALOG_H_
#define INCLUDE_NOJ_CATALOG_H_

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include "submission.h"

/// Read-only view of the course/problem data owned by the management side,
/// and the grading aggregates the pipeline writes back

struct Actor {
  std::string username;
  bool is_admin = false;
};

#define ENUM_COURSE_ROLE_ \
  X(STUDENT) \
  X(TA) \
  X(TEACHER)
enum class CourseRole {
#define X(name) name,
  ENUM_COURSE_ROLE_
#undef X
};

struct ProblemInfo {
  int problem_id;
  std::string owner;
  std::vector<std::string> courses;
  // point value of each task
  std::vector<int> task_scores;
  // bitmask of 1 << (int)Language
  int allowed_languages = 0b0111;
  // per-user daily submission limit for students; -1 for unlimited
  int quota = -1;
  bool trial_mode = false;
  // per-user trial limit; -1 for unlimited
  int trial_quota = -1;
  // code is judged as a project archive instead of a single main file
  bool zip_mode = false;
  // students may read the outputs of their own submissions
  bool artifact_collection = false;

  bool AllowsLanguage(Language lang) const {
    return allowed_languages >> (int)lang & 1;
  }
};

struct Homework {
  int homework_id;
  std::string course;
  int64_t start, end; // UNIX timestamp, seconds
  std::vector<int> problem_ids;
  std::vector<std::string> students;
  // percentage deducted from late submissions; none for no penalty
  std::optional<int> penalty;
};

struct HomeworkProblemStatus {
  int score = 0;
  int raw_score = 0;
  int problem_status = -1;
  std::vector<std::string> submission_ids;
};

struct QuotaCounter {
  int submit_count = 0;
  int64_t last_submit = 0;
};

class Catalog {
 public:
  virtual ~Catalog() = default;

  virtual std::optional<ProblemInfo> FindProblem(int problem_id) = 0;
  virtual std::optional<CourseRole> RoleIn(const std::string& course, const std::string& user) = 0;
  virtual std::vector<Homework> HomeworksOf(int problem_id) = 0;

  // TA and teacher grade; admins grade everything
  bool CanGrade(const Actor&, const ProblemInfo&);
  bool CanView(const Actor&, const ProblemInfo&);
};

class Gradebook {
 public:
  virtual ~Gradebook() = default;

  // per-user statistics of formal submissions
  virtual void RecordSubmission(const std::string& user, int problem_id,
                                const std::string& submission_id, bool accepted) = 0;
  virtual std::vector<int> AcceptedProblems(const std::string& user) = 0;

  virtual std::optional<HomeworkProblemStatus> FindHomeworkStatus(
      int homework_id, const std::string& user, int problem_id) = 0;
  virtual void SaveHomeworkStatus(int homework_id, const std::string& user, int problem_id,
                                  const HomeworkProblemStatus&) = 0;

  virtual int TrialCount(int problem_id, const std::string& user) = 0;
  virtual void IncrementTrialCount(int problem_id, const std::string& user) = 0;

  virtual QuotaCounter FindQuota(const std::string& user, int problem_id) = 0;
  virtual void SaveQuota(const std::string& user, int problem_id, const QuotaCounter&) = 0;
  // time of the user's latest formal submission, 0 if none
  virtual int64_t LastSubmit(const std::string& user) = 0;
  virtual void SetLastSubmit(const std::string& user, int64_t) = 0;
};

#endif  // INCLUDE_NOJ_CATALOG_H_
