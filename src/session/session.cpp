#include "toolmesh/session/session.hpp"
#include "toolmesh/discovery/mcp_toolset_connector.hpp"
#include "toolmesh/utils/error.hpp"
#include "toolmesh/utils/logging.hpp"

namespace toolmesh {

Session::Session(std::unique_ptr<SessionOrchestrator> orchestrator,
                 Options options, std::shared_ptr<MessageCorrelator> correlator)
    : orchestrator_(std::move(orchestrator)), options_(std::move(options)),
      correlator_(std::move(correlator)),
      debug_enabled_(options_.debug_enabled) {
  if (!orchestrator_) {
    throw SessionException(SessionException::Kind::NotInitialized,
                           "Session requires an orchestrator");
  }
}

std::unique_ptr<Session>
Session::create(config::ConfigLoader &loader,
                std::shared_ptr<engine::AgentFactory> agent_factory,
                Options options) {
  auto descriptors = loader.serverDescriptors();
  auto session_config = loader.sessionConfig();

  auto correlator = std::make_shared<MessageCorrelator>(
      std::make_shared<transport::DefaultTransportFactory>(),
      session_config.request_timeout);
  auto connector = std::make_shared<discovery::McpToolsetConnector>(
      correlator, session_config);

  auto orchestrator = std::make_unique<SessionOrchestrator>(
      connector, std::move(agent_factory), std::move(descriptors),
      session_config);

  return std::make_unique<Session>(std::move(orchestrator), std::move(options),
                                   std::move(correlator));
}

Session::~Session() {
  try {
    terminate();
  } catch (const std::exception &e) {
    TOOLMESH_LOG_ERROR("Error terminating session " +
                       options_.session_identifier + ": " + e.what());
  }
}

void Session::establish() {
  TOOLMESH_LOG_INFO("Establishing session " + options_.session_identifier +
                    " for " + options_.app_identifier);

  orchestrator_->start();

  if (debug_enabled_) {
    auto snapshot = statusSnapshot();
    emitDiagnostic(diagnostics::makeSuccessRecord(
        snapshot["perServerStatus"], "Discovery completed",
        {{"ready", snapshot["ready"]}, {"tools", snapshot["tools"]}}));
  }
}

std::unique_ptr<engine::EventStream>
Session::processUserInput(const std::string &text) {
  bool debug = debug_enabled_;
  diagnostics::DiagnosticSink sink;
  if (debug && options_.diagnostic_sink) {
    sink = options_.diagnostic_sink;
  }
  return orchestrator_->runTurn(options_.user_identifier,
                                options_.session_identifier, text, debug,
                                std::move(sink));
}

nlohmann::json Session::statusSnapshot() const {
  return {{"ready", orchestrator_->isReady()},
          {"debugEnabled", debugEnabled()},
          {"lifecycleState", toString(orchestrator_->state())},
          {"perServerStatus", discovery::toJson(orchestrator_->status())},
          {"tools", orchestrator_->toolNames()},
          {"appIdentifier", options_.app_identifier},
          {"userIdentifier", options_.user_identifier},
          {"sessionIdentifier", options_.session_identifier}};
}

void Session::setDebugEnabled(bool enabled) {
  debug_enabled_ = enabled;
  TOOLMESH_LOG_INFO(std::string("Verbose debugging ") +
                    (enabled ? "enabled" : "disabled"));
}

bool Session::toggleDebug() {
  bool enabled = !debug_enabled_.load();
  setDebugEnabled(enabled);
  return enabled;
}

bool Session::debugEnabled() const { return debug_enabled_; }

void Session::terminate() {
  orchestrator_->shutdown();
  if (correlator_) {
    correlator_->shutdownAll();
  }
}

LifecycleState Session::lifecycleState() const {
  return orchestrator_->state();
}

const Session::Options &Session::options() const { return options_; }

void Session::emitDiagnostic(
    const diagnostics::DiagnosticRecord &record) const {
  if (options_.diagnostic_sink) {
    options_.diagnostic_sink(record);
  } else {
    TOOLMESH_LOG_INFO(diagnostics::toHumanReadable(record));
  }
}

} // namespace toolmesh
