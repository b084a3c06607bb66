#include "server_io.h"

#include <charconv>
#include <optional>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "noj/utils.h"
#include "noj/paths.h"
#include "noj/errors.h"
#include "noj/migration.h"

namespace {

using nlohmann::json;

// missing or forged gateway identity
class UnauthorizedError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// --- responses ---
void Reply(httplib::Response& res, int code, const std::string& message, json data = nullptr) {
  res.status = code;
  json body{
    {"status", code < 400 ? "ok" : "err"},
    {"message", message},
    {"data", std::move(data)},
  };
  res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

using Handler = std::function<void(const httplib::Request&, httplib::Response&)>;

// The only place where errors become status codes.
Handler Wrap(Handler handler) {
  return [handler = std::move(handler)](const httplib::Request& req, httplib::Response& res) {
    try {
      handler(req, res);
    } catch (const ValidationError& err) {
      Reply(res, 400, err.what());
    } catch (const QueueFullError& err) {
      Reply(res, 202, err.what());
    } catch (const UnauthorizedError& err) {
      Reply(res, 401, err.what());
    } catch (const InvalidTokenError& err) {
      Reply(res, 403, err.what());
    } catch (const PermissionError& err) {
      Reply(res, 403, err.what());
    } catch (const TryLaterError& err) {
      Reply(res, 403, err.what());
    } catch (const NotFoundError& err) {
      Reply(res, 404, err.what());
    } catch (const ArtifactCorruptError& err) {
      Reply(res, 404, err.what());
    } catch (const ConflictError& err) {
      Reply(res, 409, err.what());
    } catch (const RateLimitError& err) {
      Reply(res, 429, fmt::format("{}\nPlease wait for {} seconds to submit.", err.what(), err.WaitFor()),
            json{{"waitFor", err.WaitFor()}});
    } catch (const WorkerUnreachableError& err) {
      Reply(res, 500, err.what());
    } catch (const StorageError& err) {
      spdlog::error("{} {}: {}", req.method, req.path, err.what());
      Reply(res, 500, err.what());
    } catch (const CacheError& err) {
      spdlog::error("{} {}: {}", req.method, req.path, err.what());
      Reply(res, 500, err.what());
    } catch (const json::exception& err) {
      Reply(res, 400, fmt::format("invalid data!\n{}", err.what()));
    }
  };
}

/// --- request helpers ---
Actor Authenticate(const ServerContext& ctx, const httplib::Request& req) {
  if (ctx.gateway_key.size() && req.get_header_value("X-Noj-Gateway-Key") != ctx.gateway_key) {
    throw UnauthorizedError("invalid gateway key");
  }
  Actor actor;
  actor.username = req.get_header_value("X-Noj-User");
  if (actor.username.empty()) throw UnauthorizedError("not logged in");
  actor.is_admin = req.get_header_value("X-Noj-Admin") == "1";
  return actor;
}

void RequireAdmin(const Actor& actor) {
  if (!actor.is_admin) throw PermissionError("admin only");
}

Submission FindSubmission(ServerContext& ctx, const std::string& id) {
  auto sub = ctx.db.Find(id);
  if (!sub) throw NotFoundError(fmt::format("{} not found", id));
  return *sub;
}

void Require(ServerContext& ctx, const Actor& actor, const Submission& sub, Capabilities caps) {
  if (!ctx.capabilities.Permitted(actor, sub, caps)) throw PermissionError("permission denied");
}

void RequireWorker(ServerContext& ctx, const httplib::Request& req) {
  std::string token = req.get_param_value("token");
  if (token.empty() || !ctx.dispatch.FindWorkerByToken(token)) {
    throw UnauthorizedError("Invalid sandbox token");
  }
}

size_t IndexParam(const std::string& str) {
  size_t val = 0;
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), val);
  if (str.empty() || ec != std::errc() || ptr != str.data() + str.size()) {
    throw ValidationError(fmt::format("invalid index {}", str));
  }
  return val;
}

std::optional<SubmissionKind> ParseKind(const std::string& flag) {
#define X(name, str) if (flag == str) return SubmissionKind::name;
  ENUM_SUBMISSION_KIND_
#undef X
  return std::nullopt;
}

std::string UploadedFile(const httplib::Request& req, const char* field) {
  if (!req.has_file(field)) throw ValidationError("can not find the source file");
  return req.get_file_value(field).content;
}

/// --- handlers ---
void CreateSubmission(ServerContext& ctx, const httplib::Request& req, httplib::Response& res) {
  Actor actor = Authenticate(ctx, req);
  auto body = json::parse(req.body);
  CreateRequest create;
  create.actor = actor;
  create.problem_id = body.at("problemId").get<int>();
  int language = body.value("languageType", -1);
  if (!ValidLanguage(language)) throw ValidationError("invalid language");
  create.language = (Language)language;
  auto kind = ParseKind(body.value("submissionType", std::string("normal")));
  if (!kind) throw ValidationError("invalid submission type");
  create.kind = *kind;
  create.use_default_case = body.value("useDefaultCase", true);
  create.ip_addr = req.get_header_value("X-Forwarded-For");
  if (create.ip_addr.empty()) create.ip_addr = req.remote_addr;

  Submission sub = ctx.lifecycle.Create(create);
  Reply(res, 200, "submission recieved.\nplease send source code with given submission id later.",
        json{{"submissionId", sub.id}});
}

void UploadCode(ServerContext& ctx, const httplib::Request& req, httplib::Response& res) {
  Actor actor = Authenticate(ctx, req);
  Submission sub = FindSubmission(ctx, req.matches[1]);
  if (sub.user != actor.username) throw PermissionError("user not equal!");
  std::string code = UploadedFile(req, "code");
  if (code.empty()) throw ValidationError("empty file");
  if (!ctx.lifecycle.Upload(sub.id, code)) {
    throw WorkerUnreachableError("Some error occurred, please contact the admin");
  }
  bool handwritten = sub.language == Language::HANDWRITTEN;
  Reply(res, 200, fmt::format("{} {}", sub.id, handwritten ? "is finished." : "send to judgement."),
        json{{"ok", true}});
}

void UploadCustomInput(ServerContext& ctx, const httplib::Request& req, httplib::Response& res) {
  Actor actor = Authenticate(ctx, req);
  Submission sub = FindSubmission(ctx, req.matches[1]);
  if (sub.user != actor.username) throw PermissionError("user not equal!");
  ctx.dispatch.UploadCustomInput(sub.id, UploadedFile(req, "input"));
  Reply(res, 200, "custom input received");
}

void GetSubmission(ServerContext& ctx, const httplib::Request& req, httplib::Response& res) {
  Actor actor = Authenticate(ctx, req);
  Submission sub = FindSubmission(ctx, req.matches[1]);
  Capabilities caps = ctx.capabilities.CapabilitiesFor(actor, sub);
  if (!(caps & Cap(CapabilityBit::VIEW))) throw PermissionError("permission denied");
  Reply(res, 200, "here you go", SubmissionToJson(sub, caps));
}

void GetOutput(ServerContext& ctx, const httplib::Request& req, httplib::Response& res) {
  Actor actor = Authenticate(ctx, req);
  Submission sub = FindSubmission(ctx, req.matches[1]);
  Require(ctx, actor, sub, Cap(CapabilityBit::VIEW_OUTPUT));
  if (sub.status < 0) throw ValidationError(fmt::format("{} has not been judged", sub.id));
  auto output = ReadCaseOutput(ctx.artifacts, sub, IndexParam(req.matches[2]), IndexParam(req.matches[3]));
  Reply(res, 200, "ok", json{{"stdout", output.stdout_text}, {"stderr", output.stderr_text}});
}

void GetTaskArtifact(ServerContext& ctx, const httplib::Request& req, httplib::Response& res) {
  Actor actor = Authenticate(ctx, req);
  Submission sub = FindSubmission(ctx, req.matches[1]);
  Require(ctx, actor, sub, Cap(CapabilityBit::VIEW_OUTPUT));
  size_t task = IndexParam(req.matches[2]);
  if (task >= sub.tasks.size()) throw NotFoundError("artifact not available");
  res.set_header("Content-Disposition",
                 fmt::format("attachment; filename=\"{}_task_{:02d}.json.zst\"", sub.id, task));
  res.set_content(BuildTaskArtifactBundle(ctx.artifacts, sub, task), "application/zstd");
}

void GetCompiledBinary(ServerContext& ctx, const httplib::Request& req, httplib::Response& res) {
  Actor actor = Authenticate(ctx, req);
  Submission sub = FindSubmission(ctx, req.matches[1]);
  Require(ctx, actor, sub, Cap(CapabilityBit::VIEW_OUTPUT));
  if (sub.compiled_binary_path.empty()) throw NotFoundError("artifact not available");
  auto binary = ctx.artifacts.Get(sub.compiled_binary_path);
  if (!binary) throw NotFoundError("artifact not available");
  res.set_header("Content-Disposition", fmt::format("attachment; filename=\"{}.bin\"", sub.id));
  res.set_content(std::move(*binary), "application/octet-stream");
}

void Rejudge(ServerContext& ctx, const httplib::Request& req, httplib::Response& res) {
  Actor actor = Authenticate(ctx, req);
  Submission sub = FindSubmission(ctx, req.matches[1]);
  Require(ctx, actor, sub, Cap(CapabilityBit::REJUDGE));
  if (!ctx.lifecycle.Rejudge(sub.id)) {
    throw WorkerUnreachableError("Some error occurred, please contact the admin");
  }
  Reply(res, 200, fmt::format("{} is sent to judgement.", sub.id));
}

void GradeSubmission(ServerContext& ctx, const httplib::Request& req, httplib::Response& res) {
  Actor actor = Authenticate(ctx, req);
  Submission sub = FindSubmission(ctx, req.matches[1]);
  Require(ctx, actor, sub, Cap(CapabilityBit::GRADE));
  auto body = json::parse(req.body);
  ctx.lifecycle.Grade(sub.id, body.at("score").get<int>());
  Reply(res, 200, fmt::format("{} score recieved.", sub.id));
}

void RejudgeAll(ServerContext& ctx, const httplib::Request& req, httplib::Response& res) {
  Actor actor = Authenticate(ctx, req);
  if (!req.has_param("problemId")) throw ValidationError("problemId is required!");
  int problem_id = (int)IndexParam(req.get_param_value("problemId"));
  auto problem = ctx.db.FindProblem(problem_id);
  if (!problem) throw NotFoundError("Unexisted problem id.");
  if (!ctx.db.CanGrade(actor, *problem)) throw PermissionError("permission denied");
  auto summary = ctx.lifecycle.RejudgeAll(problem_id);
  Reply(res, 200, "ok", json{
    {"rejudged", summary.rejudged},
    {"skipped", summary.skipped},
    {"failed", summary.failed},
  });
}

void DeleteSubmission(ServerContext& ctx, const httplib::Request& req, httplib::Response& res) {
  RequireAdmin(Authenticate(ctx, req));
  ctx.lifecycle.Delete(req.matches[1]);
  Reply(res, 200, "ok");
}

void MigrateCode(ServerContext& ctx, const httplib::Request& req, httplib::Response& res) {
  RequireAdmin(Authenticate(ctx, req));
  auto result = MigrateLegacyCode(ctx.db, ctx.artifacts, req.matches[1]);
  Reply(res, 200, "ok", json{{"result", MigrationResultName(result)}});
}

void GetConfig(ServerContext& ctx, const httplib::Request& req, httplib::Response& res) {
  RequireAdmin(Authenticate(ctx, req));
  Reply(res, 200, "ok", ctx.dispatch.Config());
}

void PutConfig(ServerContext& ctx, const httplib::Request& req, httplib::Response& res) {
  RequireAdmin(Authenticate(ctx, req));
  auto config = json::parse(req.body).get<SubmissionConfig>();
  ctx.dispatch.UpdateConfig(config);
  ctx.db.SaveSubmissionConfig(config);
  Reply(res, 200, "ok");
}

/// --- worker endpoints ---
void OnResult(ServerContext& ctx, const httplib::Request& req, httplib::Response& res) {
  std::string id = req.matches[1];
  auto body = json::parse(req.body);
  std::string token = body.value("token", std::string());
  auto worker = ctx.tokens.Verify(id, token);
  if (!worker) throw InvalidTokenError("i don't know you");
  spdlog::info("Result of submission {} from worker {}", id, *worker);
  ctx.ingestion.ProcessResult(id, ResultPayload::FromJson(body));
  Reply(res, 200, fmt::format("{} result recieved.", id));
}

void OnCaseUpload(ServerContext& ctx, const httplib::Request& req, httplib::Response& res) {
  RequireWorker(ctx, req);
  Submission sub = FindSubmission(ctx, req.matches[1]);
  size_t task = IndexParam(req.get_param_value("task"));
  size_t test_case = IndexParam(req.get_param_value("case"));
  if (req.body.empty()) throw ValidationError("empty file");
  std::string name = CaseOutputObjectName(sub.kind, task, test_case);
  if (!ctx.artifacts.Put(name, req.body)) throw StorageError("failed to store case output");
  if (!ctx.db.SetCaseOutputPath(sub.id, task, test_case, name)) {
    if (!ctx.artifacts.Remove(name)) spdlog::warn("Failed to remove orphan output {}", name);
    throw NotFoundError(fmt::format("case {}/{} not found", task, test_case));
  }
  spdlog::debug("Stored output of {} task {} case {} at {}", sub.id, task, test_case, name);
  Reply(res, 200, "ok", json{{"path", name}});
}

void OnBinaryUpload(ServerContext& ctx, const httplib::Request& req, httplib::Response& res) {
  RequireWorker(ctx, req);
  Submission sub = FindSubmission(ctx, req.matches[1]);
  if (req.body.empty()) throw ValidationError("empty file");
  std::string name = CompiledBinaryObjectName(sub.kind, sub.id);
  if (!ctx.artifacts.Put(name, req.body)) throw StorageError("failed to store compiled binary");
  ctx.db.SetCompiledBinaryPath(sub.id, name);
  Reply(res, 200, "ok", json{{"path", name}});
}

void GetLateSeconds(ServerContext& ctx, const httplib::Request& req, httplib::Response& res) {
  RequireWorker(ctx, req);
  Submission sub = FindSubmission(ctx, req.matches[1]);
  Reply(res, 200, "", json{{"lateSeconds", ctx.ingestion.LateSeconds(sub)}});
}

} // namespace

nlohmann::json SubmissionToJson(const Submission& sub, Capabilities caps) {
  bool view_output = caps & Cap(CapabilityBit::VIEW_OUTPUT);
  bool feedback = caps & Cap(CapabilityBit::FEEDBACK);
  json tasks = json::array();
  for (auto& task : sub.tasks) {
    json cases = json::array();
    for (auto& cs : task.cases) {
      json item{
        {"status", cs.status},
        {"execTime", cs.exec_time},
        {"memoryUsage", cs.memory_usage},
      };
      if (view_output) item["outputPath"] = cs.output_path;
      cases.push_back(std::move(item));
    }
    tasks.push_back(json{
      {"status", task.status},
      {"execTime", task.exec_time},
      {"memoryUsage", task.memory_usage},
      {"score", task.score},
      {"cases", std::move(cases)},
    });
  }
  json ret{
    {"submissionId", sub.id},
    {"submissionType", SubmissionKindFlag(sub.kind)},
    {"problemId", sub.problem_id},
    {"user", sub.user},
    {"languageType", (int)sub.language},
    {"timestamp", sub.timestamp},
    {"lastSend", sub.last_send},
    {"status", sub.status},
    {"score", sub.score},
    {"runTime", sub.exec_time},
    {"memoryUsage", sub.memory_usage},
    {"tasks", std::move(tasks)},
    {"checkerSummary", sub.checker_summary},
  };
  if (sub.sa_status) {
    json sa{{"status", *sub.sa_status}, {"message", sub.sa_message}};
    if (feedback) {
      sa["report"] = sub.sa_report;
      sa["reportPath"] = sub.sa_report_path;
    }
    ret["staticAnalysis"] = std::move(sa);
  }
  if (feedback) {
    ret["scoring"] = json{
      {"message", sub.scoring_message},
      {"artifactsPath", sub.scorer_artifacts_path},
      {"breakdown", sub.scoring_breakdown},
    };
  }
  if (view_output) {
    ret["checkerArtifactsPath"] = sub.checker_artifacts_path;
    ret["hasCompiledBinary"] = !sub.compiled_binary_path.empty();
  }
  if (sub.IsTrial()) {
    ret["useDefaultCase"] = sub.use_default_case;
    ret["expireAt"] = sub.expire_at;
  }
  return ret;
}

void RegisterRoutes(httplib::Server& server, ServerContext& ctx) {
  auto route = [&ctx](void (*fn)(ServerContext&, const httplib::Request&, httplib::Response&)) {
    return Wrap([&ctx, fn](const httplib::Request& req, httplib::Response& res) { fn(ctx, req, res); });
  };
  const std::string id = "([0-9a-f]+)";
  const std::string index = "([0-9]+)";

  // fixed paths go first; handlers are matched in registration order
  server.Get("/submissions/config", route(GetConfig));
  server.Put("/submissions/config", route(PutConfig));
  server.Get("/submissions/rejudge-all", route(RejudgeAll));
  server.Post("/submissions", route(CreateSubmission));

  server.Put("/submissions/" + id + "/result", route(OnResult));
  server.Put("/submissions/" + id + "/complete", route(OnResult));
  server.Put("/submissions/" + id + "/artifact/upload/case", route(OnCaseUpload));
  server.Put("/submissions/" + id + "/artifact/upload/binary", route(OnBinaryUpload));
  server.Get("/submissions/" + id + "/late-seconds", route(GetLateSeconds));

  server.Get("/submissions/" + id + "/output/" + index + "/" + index, route(GetOutput));
  server.Get("/submissions/" + id + "/artifact/task/" + index, route(GetTaskArtifact));
  server.Get("/submissions/" + id + "/artifact/compiledBinary", route(GetCompiledBinary));
  server.Get("/submissions/" + id + "/rejudge", route(Rejudge));
  server.Put("/submissions/" + id + "/grade", route(GradeSubmission));
  server.Post("/submissions/" + id + "/migrate-code", route(MigrateCode));
  server.Put("/submissions/" + id + "/custom-input", route(UploadCustomInput));
  server.Put("/submissions/" + id, route(UploadCode));
  server.Get("/submissions/" + id, route(GetSubmission));
  server.Delete("/submissions/" + id, route(DeleteSubmission));

  server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::debug("{} {} -> {}", req.method, req.path, res.status);
  });
}
