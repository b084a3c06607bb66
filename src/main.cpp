#include <thread>
#include <chrono>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <httplib.h>
#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>

#include "noj/cache.h"
#include "noj/paths.h"
#include "noj/logger.h"
#include "noj/database.h"
#include "noj/dispatch.h"
#include "noj/ingestion.h"
#include "noj/lifecycle.h"
#include "noj/capability.h"
#include "noj/token_broker.h"
#include "noj/artifact_store.h"
#include "noj/submission_config.h"
#include "server_io.h"

namespace {

struct Options {
  std::string listen_host = "0.0.0.0";
  int port = 8080;
  std::string gateway_key;
  long trial_ttl_days = 14;
  long capability_ttl = 60;
  long token_ttl = 0;
  long purge_interval = 600;
  SubmissionConfig submission_config = SubmissionConfig::Default();
  RedisConfig redis;
} opts;

std::vector<std::string> SplitNames(const std::string& str) {
  std::vector<std::string> ret;
  size_t start = 0;
  while (start <= str.size()) {
    size_t end = str.find(',', start);
    if (end == std::string::npos) end = str.size();
    std::string name = str.substr(start, end - start);
    name.erase(0, name.find_first_not_of(' '));
    name.erase(name.find_last_not_of(' ') + 1);
    if (name.size()) ret.push_back(std::move(name));
    start = end + 1;
  }
  return ret;
}

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string data_dir = ini[""]["data_dir"] | "";
  if (data_dir.size()) kDataDir = data_dir;
  opts.listen_host = ini[""]["listen_host"] | opts.listen_host;
  opts.port = ini[""]["port"] | opts.port;
  opts.gateway_key = ini[""]["gateway_key"] | opts.gateway_key;
  opts.trial_ttl_days = ini[""]["trial_ttl_days"] | opts.trial_ttl_days;
  opts.capability_ttl = ini[""]["capability_ttl"] | opts.capability_ttl;
  opts.token_ttl = ini[""]["token_ttl"] | opts.token_ttl;
  opts.purge_interval = ini[""]["purge_interval"] | opts.purge_interval;
  opts.submission_config.rate_limit = ini[""]["rate_limit"] | opts.submission_config.rate_limit;

  auto redis = ini["redis"];
  opts.redis.host = redis["host"] | opts.redis.host;
  opts.redis.port = redis["port"] | opts.redis.port;
  opts.redis.password = redis["password"] | opts.redis.password;
  opts.redis.retry_interval = redis["retry_interval"] | opts.redis.retry_interval;
  opts.redis.prefix = redis["prefix"] | opts.redis.prefix;

  std::string workers = ini[""]["workers"] | "";
  if (auto names = SplitNames(workers); names.size()) {
    opts.submission_config.workers.clear();
    for (auto& name : names) {
      auto section = ini["worker:" + name];
      WorkerRegistration worker{name, section["url"] | "", section["token"] | ""};
      if (worker.url.empty() || worker.token.empty()) {
        spdlog::error("Worker {} needs both url and token", name);
        return false;
      }
      opts.submission_config.workers.push_back(std::move(worker));
    }
  }
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "noj-pipeline");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/noj-pipeline.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--port")
    .scan<'d', int>()
    .help("Port to listen on");
  parser.add_argument("-d", "--data-dir")
    .help("Directory of the database and the artifact store");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  InitLogger(VerbosityToLevel(verbosity));
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<int>("--port")) {
    opts.port = val.value();
  }
  if (auto val = parser.present("--data-dir")) {
    kDataDir = val.value();
  }
}

bool PrepareDataDir() {
  std::error_code ec;
  fs::create_directories(ArtifactRoot(), ec);
  if (ec) {
    spdlog::error("Failed to create {}: {}", ArtifactRoot().string(), ec.message());
    return false;
  }
  return true;
}

void PurgeLoop(LifecycleManager& lifecycle) {
  while (true) {
    std::this_thread::sleep_for(std::chrono::seconds(opts.purge_interval));
    try {
      lifecycle.PurgeExpired();
    } catch (const std::runtime_error& err) {
      spdlog::error("Failed to purge expired trial submissions: {}", err.what());
    }
  }
}

} // namespace

int main(int argc, char** argv) {
  InitLogger();
  ParseArgs(argc, argv);
  if (!PrepareDataDir()) return 1;

  Database db(DatabasePath());
  if (auto stored = db.LoadSubmissionConfig()) {
    spdlog::info("Using submission config stored in the database");
    opts.submission_config = std::move(*stored);
  }
  ArtifactStore artifacts(ArtifactRoot());
  RedisCache cache(opts.redis);
  if (!cache.Ping()) {
    spdlog::error("Redis server {}:{} is not available", opts.redis.host, opts.redis.port);
    return 1;
  }
  TokenBroker tokens(cache, opts.token_ttl);
  CapabilityEngine capabilities(db, cache, opts.capability_ttl);
  DispatchCoordinator dispatch(db, artifacts, tokens, opts.submission_config);
  ResultIngestion ingestion(db, artifacts, db, db);
  LifecycleManager lifecycle(db, artifacts, dispatch, db, db, UnixTimestamp,
                             opts.trial_ttl_days * 86400);
  dispatch.SetReporter({
    .ReportDispatchFailure = [&](const Submission& sub, const std::string& message, Status status) {
      ingestion.RecordDispatchFailure(sub, message, status);
    },
  });

  std::thread purge_thread(PurgeLoop, std::ref(lifecycle));
  purge_thread.detach();

  ServerContext ctx{db, artifacts, tokens, capabilities, dispatch, ingestion, lifecycle,
                    opts.gateway_key};
  httplib::Server server;
  RegisterRoutes(server, ctx);
  spdlog::info("Listening on {}:{}, data directory {}", opts.listen_host, opts.port, kDataDir.string());
  if (!server.listen(opts.listen_host.c_str(), opts.port)) {
    spdlog::error("Failed to listen on {}:{}", opts.listen_host, opts.port);
    return 1;
  }
}
