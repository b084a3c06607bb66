#ifndef INCLUDE_NOJ_WORKER_CLIENT_H_
#define INCLUDE_NOJ_WORKER_CLIENT_H_

#include <string>
#include <variant>
#include <optional>

#include "submission.h"
#include "submission_config.h"

/// Outbound calls to workers ("sandboxes")

constexpr int kWorkerProbeTimeout = 1; // seconds
constexpr int kWorkerSubmitTimeout = 30;

struct JobRequest {
  std::string submission_id;
  std::string token;
  int problem_id;
  Language language;
  SubmissionKind kind;
  std::string code;
  // trial only
  bool use_default_case = true;
  std::string custom_input_path;
};

// Answer of POST /submit/{id}, decoded once from the HTTP status.
struct WorkerAccepted {};
struct WorkerQueueFull {};
struct WorkerInvalidToken {};
struct WorkerBadRequest {
  std::string message;
};
struct WorkerUnexpected {
  int status; // -1 if no response was received
  std::string message;
};
using WorkerResponse = std::variant<
    WorkerAccepted, WorkerQueueFull, WorkerInvalidToken, WorkerBadRequest, WorkerUnexpected>;

WorkerResponse DecodeWorkerResponse(int status, const std::string& body);

// Load reported by GET /status; std::nullopt if the worker is unreachable
// or does not answer with a numeric load.
std::optional<double> ProbeWorkerLoad(const WorkerRegistration&);

WorkerResponse PostJob(const WorkerRegistration&, const JobRequest&);

#endif  // INCLUDE_NOJ_WORKER_CLIENT_H_
