#ifndef INCLUDE_NOJ_DISPATCH_H_
#define INCLUDE_NOJ_DISPATCH_H_

#include <mutex>
#include <string>
#include <optional>
#include <functional>

#include "utils.h"
#include "submission.h"
#include "token_broker.h"
#include "worker_client.h"
#include "artifact_store.h"
#include "submission_store.h"
#include "submission_config.h"

// bytes
constexpr size_t kMaxCodeSize = 10'000'000;
constexpr size_t kMaxProjectSize = 1ul << 30;
constexpr size_t kMaxCustomInputSize = 10'000'000;

// Validates an uploaded code archive. Returns the rejection message, or
// std::nullopt if the archive is acceptable.
std::optional<std::string> CheckCode(const std::string& blob, Language, bool zip_mode);
std::optional<std::string> CheckCustomInput(const std::string& blob);

class DispatchCoordinator {
 public:
  struct Reporter {
    // A trial dispatch failed before judging could start. The status is CE
    // if the worker rejected the request and JE otherwise.
    std::function<void(const Submission&, const std::string& message, Status)> ReportDispatchFailure;
  };

 private:
  SubmissionStore& store_;
  ArtifactStore& artifacts_;
  TokenBroker& tokens_;
  Clock clock_;
  Reporter reporter_;

  mutable std::mutex config_mtx_;
  SubmissionConfig config_;

  std::optional<std::string> LoadCode_(const Submission&);
  void ReportFailure_(const Submission&, const std::string& message, Status);
 public:
  DispatchCoordinator(SubmissionStore& store, ArtifactStore& artifacts, TokenBroker& tokens,
                      SubmissionConfig config, Clock clock = UnixTimestamp) :
      store_(store), artifacts_(artifacts), tokens_(tokens), clock_(std::move(clock)),
      config_(std::move(config)) {}

  void SetReporter(Reporter reporter) { reporter_ = std::move(reporter); }

  SubmissionConfig Config() const;
  // Replaces the worker registry and rate limit after every new worker
  // answered its status probe; throws ValidationError otherwise.
  void UpdateConfig(SubmissionConfig);

  // The reachable worker with the lowest reported load.
  std::optional<WorkerRegistration> SelectWorker();
  std::optional<WorkerRegistration> FindWorkerByToken(const std::string& token) const;

  // Validates and stores the code of a submission, then dispatches it.
  // throws NotFoundError, PermissionError (already judged or uploaded),
  //   ValidationError, QueueFullError, InvalidTokenError
  bool Submit(const std::string& id, const std::string& code);
  // trial only; must precede Submit when default cases are not used
  void UploadCustomInput(const std::string& id, const std::string& blob);

  // Sends a submission whose code is already stored. Returns false if no
  // worker is reachable or the worker answered unexpectedly; a formal
  // submission is then left as it was, a trial one is reported as failed.
  // Handwritten submissions are never sent.
  // throws ValidationError, QueueFullError, InvalidTokenError
  bool Send(const Submission&);
};

#endif  // INCLUDE_NOJ_DISPATCH_H_
