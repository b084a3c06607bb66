#include "noj/worker_client.h"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "noj/utils.h"
#include "http_utils.h"

WorkerResponse DecodeWorkerResponse(int status, const std::string& body) {
  switch (status) {
    case 200: return WorkerAccepted{};
    case 500: return WorkerQueueFull{};
    case 400: return WorkerBadRequest{body};
    case 403: return WorkerInvalidToken{};
  }
  return WorkerUnexpected{status, body};
}

std::optional<double> ProbeWorkerLoad(const WorkerRegistration& worker) {
  httplib::Client cli(http_utils::TrimBaseUrl(worker.url));
  cli.set_connection_timeout(kWorkerProbeTimeout, 0);
  cli.set_read_timeout(kWorkerProbeTimeout, 0);
  auto res = HTTPRequest<HTTPGet>(cli, "/status");
  if (!res) {
    spdlog::warn("Worker {} ({}) is unreachable: {}", worker.name, worker.url,
                 httplib::to_string(res.error()));
    return std::nullopt;
  }
  if (!http_utils::IsSuccess(res->status)) {
    spdlog::warn("Worker {} ({}) status probe returned {}", worker.name, worker.url, res->status);
    return std::nullopt;
  }
  try {
    auto data = nlohmann::json::parse(res->body);
    return data.at("load").get<double>();
  } catch (nlohmann::json::exception& err) {
    spdlog::warn("Worker {} ({}) returned invalid status: {}", worker.name, worker.url, err.what());
    return std::nullopt;
  }
}

WorkerResponse PostJob(const WorkerRegistration& worker, const JobRequest& job) {
  httplib::Client cli(http_utils::TrimBaseUrl(worker.url));
  cli.set_connection_timeout(kWorkerProbeTimeout, 0);
  cli.set_read_timeout(kWorkerSubmitTimeout, 0);
  httplib::MultipartFormDataItems items = {
    {"src", job.code, "code.zip", "application/zip"},
    {"token", job.token, "", ""},
    {"problem_id", std::to_string(job.problem_id), "", ""},
    {"language", std::to_string((int)job.language), "", ""},
    {"submission_type", SubmissionKindFlag(job.kind), "", ""},
  };
  if (job.kind == SubmissionKind::TRIAL) {
    items.push_back({"use_default_case", job.use_default_case ? "true" : "false", "", ""});
    if (job.custom_input_path.size()) {
      items.push_back({"custom_testcases_path", job.custom_input_path, "", ""});
    }
  }
  auto res = HTTPRequest<HTTPPost>(cli, "/submit/" + job.submission_id, items);
  if (!res) return WorkerUnexpected{-1, httplib::to_string(res.error())};
  return DecodeWorkerResponse(res->status, res->body);
}
