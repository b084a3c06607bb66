#include "noj/capability.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

std::string CapabilitiesToString(Capabilities caps) {
  std::string ret;
#define X(name) \
  if (caps & Cap(CapabilityBit::name)) { \
    if (ret.size()) ret += '|'; \
    ret += #name; \
  }
  ENUM_CAPABILITY_
#undef X
  return ret;
}

Capabilities CapabilityEngine::Compute_(const Actor& actor, const Submission& sub) {
  auto problem = catalog_.FindProblem(sub.problem_id);
  if (!problem) {
    spdlog::warn("Submission {} refers to missing problem {}", sub.id, sub.problem_id);
    return actor.is_admin ? kCapManager : kCapNone;
  }
  if (catalog_.CanGrade(actor, *problem)) return kCapManager;
  if (actor.username == sub.user) {
    Capabilities caps = kCapStudent;
    // a compile error exposes no hidden test data
    if (sub.status == (int)Status::CE || problem->artifact_collection) {
      caps |= Cap(CapabilityBit::VIEW_OUTPUT);
    }
    return caps;
  }
  if (catalog_.CanView(actor, *problem)) return kCapOther;
  return kCapNone;
}

Capabilities CapabilityEngine::CapabilitiesFor(const Actor& actor, const Submission& sub) {
  if (ttl_ <= 0) return Compute_(actor, sub);
  std::string key = fmt::format("SUBMISSION_PERMISSION_{}_{}_{}", sub.id, actor.username, sub.problem_id);
  if (auto cached = cache_.Get(key)) return std::stoul(*cached);
  Capabilities caps = Compute_(actor, sub);
  cache_.Set(key, std::to_string(caps), ttl_);
  spdlog::debug("Capabilities of {} on submission {}: {}", actor.username, sub.id,
                CapabilitiesToString(caps));
  return caps;
}
