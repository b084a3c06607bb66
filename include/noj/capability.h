#ifndef INCLUDE_NOJ_CAPABILITY_H_
#define INCLUDE_NOJ_CAPABILITY_H_

#include <string>
#include <cstdint>

#include "cache.h"
#include "catalog.h"
#include "submission.h"

#define ENUM_CAPABILITY_ \
  X(VIEW) \
  X(UPLOAD) \
  X(FEEDBACK) \
  X(COMMENT) \
  X(REJUDGE) \
  X(GRADE) \
  X(VIEW_OUTPUT)
enum class CapabilityBit {
#define X(name) name,
  ENUM_CAPABILITY_
#undef X
};

using Capabilities = uint32_t;

constexpr Capabilities Cap(CapabilityBit bit) { return 1u << (int)bit; }

constexpr Capabilities kCapNone = 0;
constexpr Capabilities kCapOther = Cap(CapabilityBit::VIEW);
constexpr Capabilities kCapStudent =
    Cap(CapabilityBit::VIEW) | Cap(CapabilityBit::UPLOAD) | Cap(CapabilityBit::FEEDBACK);
constexpr Capabilities kCapManager =
#define X(name) Cap(CapabilityBit::name) |
    ENUM_CAPABILITY_
#undef X
    0;

// "VIEW|UPLOAD|FEEDBACK"
std::string CapabilitiesToString(Capabilities);

// Computes what an actor may do with a submission. Results are cached for
// ttl seconds and are not invalidated when the submission changes, so a
// status transition (e.g. to CE) may take up to ttl to be reflected.
// ttl <= 0 disables caching.
class CapabilityEngine {
  Catalog& catalog_;
  KeyValueCache& cache_;
  long ttl_;

  Capabilities Compute_(const Actor&, const Submission&);
 public:
  CapabilityEngine(Catalog& catalog, KeyValueCache& cache, long ttl = 60) :
      catalog_(catalog), cache_(cache), ttl_(ttl) {}

  Capabilities CapabilitiesFor(const Actor&, const Submission&);
  bool Permitted(const Actor& actor, const Submission& sub, Capabilities required) {
    return (CapabilitiesFor(actor, sub) & required) == required;
  }
};

#endif  // INCLUDE_NOJ_CAPABILITY_H_
