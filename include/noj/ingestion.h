#ifndef INCLUDE_NOJ_INGESTION_H_
#define INCLUDE_NOJ_INGESTION_H_

#include <string>
#include <optional>

#include <nlohmann/json.hpp>

#include "utils.h"
#include "catalog.h"
#include "submission.h"
#include "artifact_store.h"
#include "submission_store.h"

// Body of the worker's result callback.
struct ResultPayload {
  // tasks[i][j] is the report of case j of task i:
  //   {status, execTime, memoryUsage, stdout, stderr, exitCode}
  nlohmann::json tasks;
  // the following are null if absent
  nlohmann::json static_analysis;
  nlohmann::json checker;
  nlohmann::json scoring;
  std::optional<std::string> status_override;

  // throws ValidationError
  static ResultPayload FromJson(const nlohmann::json&);
};

class ResultIngestion {
  SubmissionStore& store_;
  ArtifactStore& artifacts_;
  Catalog& catalog_;
  Gradebook& gradebook_;

  std::string PutText_(const std::string& name, const std::string& text);
 public:
  ResultIngestion(SubmissionStore& store, ArtifactStore& artifacts, Catalog& catalog,
                  Gradebook& gradebook) :
      store_(store), artifacts_(artifacts), catalog_(catalog), gradebook_(gradebook) {}

  // Aggregates a worker callback into the submission record and runs the
  // post-judging bookkeeping of its kind. The caller must have verified the
  // callback token.
  // throws NotFoundError, ValidationError, StorageError
  void ProcessResult(const std::string& id, const ResultPayload&);

  // Records a trial that failed before judging as one task with one case
  // whose stderr carries the message.
  void RecordDispatchFailure(const Submission&, const std::string& message, Status);

  // Seconds past the deadline of the homeworks the submission counts for,
  // the minimum over all of them; -1 if it counts for none.
  long LateSeconds(const Submission&);
};

#endif  // INCLUDE_NOJ_INGESTION_H_
