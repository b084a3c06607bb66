#ifndef INCLUDE_NOJ_ARTIFACT_STORE_H_
#define INCLUDE_NOJ_ARTIFACT_STORE_H_

#include <string>
#include <optional>
#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

#include "submission.h"

namespace fs = std::filesystem;

// Object store keyed by slash-separated names, laid out as files under a
// root directory. Writes are atomic per object.
class ArtifactStore {
  fs::path root_;

  // empty if the name escapes the root
  fs::path Resolve_(const std::string& name) const;
 public:
  explicit ArtifactStore(fs::path root) : root_(std::move(root)) {}

  const fs::path& Root() const { return root_; }

  bool Put(const std::string& name, std::string_view data);
  std::optional<std::string> Get(const std::string& name) const;
  bool Exists(const std::string& name) const;
  bool Remove(const std::string& name);
};

struct CaseOutput {
  std::string stdout_text;
  std::string stderr_text;
};

std::string ZstdCompress(std::string_view);
// std::nullopt if the input is not one complete zstd frame
std::optional<std::string> ZstdDecompress(std::string_view);

std::string PackCaseOutput(const CaseOutput&);
// throws ArtifactCorruptError
CaseOutput UnpackCaseOutput(std::string_view);

// Reads one case output of a judged submission.
// throws NotFoundError if the case does not exist or its object is missing,
//   ArtifactCorruptError if the object cannot be decoded
CaseOutput ReadCaseOutput(const ArtifactStore&, const Submission&, size_t task, size_t test_case);

// Bundles every readable case output of a task into one compressed document
// keyed "task_TT/case_CC/stdout" and "task_TT/case_CC/stderr". Unreadable
// cases are skipped with a warning.
// throws NotFoundError if no case could be read
std::string BuildTaskArtifactBundle(const ArtifactStore&, const Submission&, size_t task);
// throws ArtifactCorruptError
nlohmann::json ReadTaskArtifactBundle(std::string_view);

#endif  // INCLUDE_NOJ_ARTIFACT_STORE_H_
