#include "noj/dispatch.h"

#include <limits>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "noj/paths.h"
#include "noj/errors.h"
#include "utils.h"
#include "zip_reader.h"

namespace {

// "dir/main.cpp" -> {"dir/main", ".cpp"}; leading dots of the file name do
//   not start an extension
std::pair<std::string, std::string> SplitExtension(const std::string& name) {
  size_t slash = name.rfind('/');
  size_t base = slash == std::string::npos ? 0 : slash + 1;
  size_t dot = name.rfind('.');
  if (dot == std::string::npos || dot < base) return {name, ""};
  size_t first = name.find_first_not_of('.', base);
  if (first == std::string::npos || dot < first) return {name, ""};
  return {name.substr(0, dot), name.substr(dot)};
}

} // namespace

std::optional<std::string> CheckCode(const std::string& blob, Language lang, bool zip_mode) {
  if (blob.empty()) return "no file";
  auto entries = ReadZipDirectory(blob);
  if (!entries) return "not a valid zip file";
  if (zip_mode) {
    if (blob.size() > kMaxProjectSize) return "code file size too large (limit 1GB)";
    return std::nullopt;
  }

  uint64_t total_size = 0;
  for (auto& entry : *entries) total_size += entry.uncompressed_size;
  if (total_size > kMaxCodeSize) return "code file size too large";
  if (entries->size() != 1) return "more than one file in zip";

  auto& entry = entries->front();
  auto [name, ext] = SplitExtension(entry.name);
  if (name != "main") return "only accept file with name 'main'";
  if (ext != LanguageExtension(lang)) return "invalid file extension, got " + ext;
  if (lang == Language::HANDWRITTEN) {
    auto magic = ReadZipEntryPrefix(blob, entry, 5);
    if (!magic || *magic != "%PDF-") return "only accept PDF file.";
  }
  return std::nullopt;
}

std::optional<std::string> CheckCustomInput(const std::string& blob) {
  if (blob.empty()) return "no file";
  if (blob.size() > kMaxCustomInputSize) return "custom input file size too large";
  if (!ReadZipDirectory(blob)) return "not a valid zip file";
  return std::nullopt;
}

SubmissionConfig DispatchCoordinator::Config() const {
  std::lock_guard lck(config_mtx_);
  return config_;
}

void DispatchCoordinator::UpdateConfig(SubmissionConfig config) {
  if (config.rate_limit < 0) throw ValidationError("rate limit must be non-negative");
  for (auto& worker : config.workers) {
    if (!ProbeWorkerLoad(worker)) {
      throw ValidationError(fmt::format("sandbox {} ({}) is unreachable", worker.name, worker.url));
    }
  }
  std::lock_guard lck(config_mtx_);
  config_ = std::move(config);
  spdlog::info("Submission config updated: rate limit {}, {} workers",
               config_.rate_limit, config_.workers.size());
}

std::optional<WorkerRegistration> DispatchCoordinator::SelectWorker() {
  // query worker status outside the lock; a slow worker must not block config readers
  auto workers = Config().workers;
  std::optional<WorkerRegistration> ret;
  double min_load = std::numeric_limits<double>::infinity();
  for (auto& worker : workers) {
    auto load = ProbeWorkerLoad(worker);
    if (!load) continue;
    spdlog::debug("Worker {} load {}", worker.name, *load);
    if (*load < min_load) {
      min_load = *load;
      ret = worker;
    }
  }
  return ret;
}

std::optional<WorkerRegistration> DispatchCoordinator::FindWorkerByToken(const std::string& token) const {
  std::lock_guard lck(config_mtx_);
  for (auto& worker : config_.workers) {
    if (ConstantTimeEquals(worker.token, token)) return worker;
  }
  return std::nullopt;
}

std::optional<std::string> DispatchCoordinator::LoadCode_(const Submission& sub) {
  if (sub.code_path.size()) return artifacts_.Get(sub.code_path);
  if (sub.legacy_code.size()) return sub.legacy_code;
  return std::nullopt;
}

void DispatchCoordinator::ReportFailure_(const Submission& sub, const std::string& message,
                                         Status status) {
  if (!sub.IsTrial() || !reporter_.ReportDispatchFailure) return;
  reporter_.ReportDispatchFailure(sub, message, status);
}

bool DispatchCoordinator::Submit(const std::string& id, const std::string& code) {
  auto sub = store_.Find(id);
  if (!sub) throw NotFoundError(fmt::format("{} not found", id));
  if (sub->status >= 0) throw PermissionError(fmt::format("{} has finished judgement", id));
  if (sub->HasCode()) throw PermissionError(fmt::format("{} has been uploaded", id));
  if (auto err = CheckCode(code, sub->language, sub->zip_mode)) {
    spdlog::info("Rejected code of submission {}: {}", id, *err);
    throw ValidationError(*err);
  }
  if (sub->IsTrial() && !sub->use_default_case && sub->custom_input_path.empty()) {
    throw ValidationError("custom input is required when default cases are not used");
  }

  std::string path = CodeObjectName();
  if (!artifacts_.Put(path, code)) throw StorageError("failed to store code");
  store_.SetCodePath(id, path);
  sub->code_path = path;
  spdlog::info("Stored code of submission {} at {}", id, path);

  if (sub->language == Language::HANDWRITTEN) {
    // graded by hand; never sent to a worker
    store_.MarkJudging(id, clock_());
    return true;
  }
  return Send(*sub);
}

void DispatchCoordinator::UploadCustomInput(const std::string& id, const std::string& blob) {
  auto sub = store_.Find(id);
  if (!sub) throw NotFoundError(fmt::format("{} not found", id));
  if (!sub->IsTrial()) throw ValidationError("custom input is only accepted for trial submissions");
  if (sub->use_default_case) throw ValidationError("submission uses the default test cases");
  if (sub->HasCode()) throw PermissionError(fmt::format("{} has been uploaded", id));
  if (auto err = CheckCustomInput(blob)) throw ValidationError(*err);

  std::string path = CustomInputObjectName();
  if (!artifacts_.Put(path, blob)) throw StorageError("failed to store custom input");
  if (sub->custom_input_path.size()) IGNORE_RETURN(artifacts_.Remove(sub->custom_input_path));
  store_.SetCustomInputPath(id, path);
}

bool DispatchCoordinator::Send(const Submission& sub) {
  if (sub.language == Language::HANDWRITTEN) {
    spdlog::warn("Try to send handwritten submission {}", sub.id);
    return false;
  }
  auto code = LoadCode_(sub);
  if (!code) {
    spdlog::error("Code of submission {} not found", sub.id);
    ReportFailure_(sub, "Submission code not found.", Status::JE);
    return false;
  }
  auto worker = SelectWorker();
  if (!worker) {
    spdlog::error("No available worker for submission {}", sub.id);
    ReportFailure_(sub, "No available sandbox instance.", Status::JE);
    return false;
  }

  // mark before the network call so that a crash leaves the submission in flight
  store_.MarkJudging(sub.id, clock_());
  JobRequest job{
    .submission_id = sub.id,
    .token = tokens_.Issue(sub.id, worker->name),
    .problem_id = sub.problem_id,
    .language = sub.language,
    .kind = sub.kind,
    .code = std::move(*code),
    .use_default_case = sub.use_default_case,
    .custom_input_path = sub.custom_input_path,
  };
  spdlog::info("Send submission {} to worker {} (type={})", sub.id, worker->name,
               SubmissionKindFlag(sub.kind));
  auto res = PostJob(*worker, job);

  if (std::holds_alternative<WorkerAccepted>(res)) return true;
  if (auto bad = std::get_if<WorkerBadRequest>(&res)) {
    tokens_.Revoke(sub.id);
    spdlog::error("Worker {} rejected submission {}: {}", worker->name, sub.id, bad->message);
    ReportFailure_(sub, bad->message, Status::CE);
    throw ValidationError(bad->message);
  }
  if (std::holds_alternative<WorkerQueueFull>(res)) {
    tokens_.Revoke(sub.id);
    spdlog::warn("Worker {} queue is full, submission {} not sent", worker->name, sub.id);
    throw QueueFullError("judge queue is full");
  }
  if (std::holds_alternative<WorkerInvalidToken>(res)) {
    tokens_.Revoke(sub.id);
    spdlog::warn("Worker {} rejected the token of submission {}", worker->name, sub.id);
    throw InvalidTokenError("invalid token");
  }
  auto& unexpected = std::get<WorkerUnexpected>(res);
  spdlog::error("Failed to send submission {} to worker {}: status={} {}", sub.id, worker->name,
                unexpected.status, unexpected.message);
  ReportFailure_(sub, fmt::format("Sandbox communication error: {}", unexpected.message), Status::JE);
  return false;
}
