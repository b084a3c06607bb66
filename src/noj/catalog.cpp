#include "noj/catalog.h"

bool Catalog::CanGrade(const Actor& actor, const ProblemInfo& problem) {
  if (actor.is_admin) return true;
  for (auto& course : problem.courses) {
    auto role = RoleIn(course, actor.username);
    if (role && *role != CourseRole::STUDENT) return true;
  }
  return false;
}

bool Catalog::CanView(const Actor& actor, const ProblemInfo& problem) {
  if (actor.is_admin || actor.username == problem.owner) return true;
  for (auto& course : problem.courses) {
    if (RoleIn(course, actor.username)) return true;
  }
  return false;
}
