#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "noj/database.h"
#include "noj/dispatch.h"
#include "noj/ingestion.h"
#include "noj/lifecycle.h"
#include "noj/capability.h"
#include "noj/submission.h"
#include "noj/token_broker.h"
#include "noj/artifact_store.h"

struct ServerContext {
  Database& db;
  ArtifactStore& artifacts;
  TokenBroker& tokens;
  CapabilityEngine& capabilities;
  DispatchCoordinator& dispatch;
  ResultIngestion& ingestion;
  LifecycleManager& lifecycle;
  // shared secret of the gateway; empty to accept any caller
  std::string gateway_key;
};

// Client view of a submission; fields are filtered by the caller's capabilities.
nlohmann::json SubmissionToJson(const Submission&, Capabilities);

// Registers every /submissions route. The handlers keep references into ctx.
void RegisterRoutes(httplib::Server&, ServerContext& ctx);

#endif  // SERVER_IO_H_
