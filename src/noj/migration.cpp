#include "noj/migration.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "noj/paths.h"
#include "noj/errors.h"
#include "utils.h"

const char* MigrationResultName(MigrationResult res) {
  switch (res) {
#define X(name) case MigrationResult::name: return #name;
    ENUM_MIGRATION_RESULT_
#undef X
  }
  __builtin_unreachable();
}

MigrationResult MigrateLegacyCode(SubmissionStore& store, ArtifactStore& artifacts,
                                  const std::string& id) {
  auto sub = store.Find(id);
  if (!sub) throw NotFoundError(fmt::format("{} not found", id));
  if (sub->legacy_code.empty()) {
    spdlog::debug("Submission {} has no legacy code", id);
    return MigrationResult::NOTHING_TO_MIGRATE;
  }
  if (sub->code_path.empty()) {
    std::string path = CodeObjectName();
    if (!artifacts.Put(path, sub->legacy_code)) throw StorageError("failed to store code");
    store.SetCodePath(id, path);
    sub->code_path = path;
    spdlog::info("Uploaded legacy code of submission {} to {}", id, path);
  }

  std::string legacy_checksum = Md5Hex(sub->legacy_code);
  spdlog::info("Calculated legacy checksum. submission={} checksum={}", id, legacy_checksum);
  auto current = artifacts.Get(sub->code_path);
  if (!current) {
    spdlog::warn("Code of submission {} at {} is unreadable, keeping legacy copy", id, sub->code_path);
    return MigrationResult::MISMATCH;
  }
  std::string current_checksum = Md5Hex(*current);
  spdlog::info("Calculated current checksum. submission={} checksum={}", id, current_checksum);
  if (current_checksum != legacy_checksum) {
    spdlog::warn("Data inconsistent for submission {} (legacy {}, current {}), "
                 "keeping both copies; manual intervention required",
                 id, legacy_checksum, current_checksum);
    return MigrationResult::MISMATCH;
  }
  store.ClearLegacyCode(id);
  spdlog::info("Migrated code of submission {}", id);
  return MigrationResult::MIGRATED;
}
