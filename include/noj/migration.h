#ifndef INCLUDE_NOJ_MIGRATION_H_
#define INCLUDE_NOJ_MIGRATION_H_

#include <string>

#include "artifact_store.h"
#include "submission_store.h"

#define ENUM_MIGRATION_RESULT_ \
  X(NOTHING_TO_MIGRATE) \
  X(MIGRATED) \
  X(MISMATCH)
enum class MigrationResult {
#define X(name) name,
  ENUM_MIGRATION_RESULT_
#undef X
};

const char* MigrationResultName(MigrationResult);

// Moves the inline code blob of a submission into the artifact store. The
// inline copy is dropped only if both copies hash the same; on mismatch both
// are kept and a warning is logged for manual inspection.
// throws NotFoundError, StorageError
MigrationResult MigrateLegacyCode(SubmissionStore&, ArtifactStore&, const std::string& id);

#endif  // INCLUDE_NOJ_MIGRATION_H_
