#include "toolmesh/session/session_orchestrator.hpp"
#include "toolmesh/utils/error.hpp"
#include "toolmesh/utils/logging.hpp"

#include <thread>

namespace toolmesh {

namespace {

void markDisconnected(discovery::StatusMap &statuses) {
  for (auto &[name, status] : statuses) {
    if (status.state == discovery::ServerState::Connected) {
      status.state = discovery::ServerState::Disconnected;
    }
  }
}

} // namespace

std::string toString(LifecycleState state) {
  switch (state) {
  case LifecycleState::Uninitialized:
    return "uninitialized";
  case LifecycleState::Discovering:
    return "discovering";
  case LifecycleState::Ready:
    return "ready";
  case LifecycleState::ShuttingDown:
    return "shutting_down";
  case LifecycleState::Terminated:
    return "terminated";
  case LifecycleState::Failed:
    return "failed";
  }
  return "unknown";
}

SessionOrchestrator::SessionOrchestrator(
    std::shared_ptr<discovery::ToolsetConnector> connector,
    std::shared_ptr<engine::AgentFactory> agent_factory,
    config::ServerDescriptors descriptors, config::SessionConfig config)
    : connector_(std::move(connector)),
      agent_factory_(std::move(agent_factory)),
      descriptors_(std::move(descriptors)), config_(std::move(config)),
      state_(LifecycleState::Uninitialized),
      turn_in_progress_(std::make_shared<std::atomic<bool>>(false)) {}

SessionOrchestrator::~SessionOrchestrator() {
  try {
    shutdown();
  } catch (const std::exception &e) {
    TOOLMESH_LOG_ERROR("Error during session shutdown: " +
                       std::string(e.what()));
  }
}

void SessionOrchestrator::start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != LifecycleState::Uninitialized &&
        state_ != LifecycleState::Failed) {
      TOOLMESH_LOG_WARNING("Session start ignored: session is " +
                           toString(state_));
      return;
    }
    state_ = LifecycleState::Discovering;
  }

  discovery::ToolsetDiscovery discovery(connector_, config_);
  auto result = discovery.discoverAll(descriptors_);

  engine::AgentDefinition definition{config_.agent_name, config_.model_name,
                                     config_.system_instruction,
                                     result.toolsets};

  std::shared_ptr<engine::ExecutionEngine> agent;
  std::string failure;
  try {
    if (!agent_factory_) {
      throw EngineException("No agent factory configured");
    }
    agent = agent_factory_->create(definition);
    if (!agent) {
      failure = "Agent factory returned no engine";
    }
  } catch (const std::exception &e) {
    failure = e.what();
  }

  if (!agent) {
    TOOLMESH_LOG_ERROR("Failed to create agent '" + config_.agent_name +
                       "': " + failure);
    closeToolsets(result.toolsets);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      statuses_ = std::move(result.statuses);
      // A shutdown requested during discovery still ends in terminated
      if (state_ == LifecycleState::ShuttingDown) {
        markDisconnected(statuses_);
        state_ = LifecycleState::Terminated;
      } else {
        state_ = LifecycleState::Failed;
      }
    }
    throw EngineException("Failed to create agent '" + config_.agent_name +
                              "': " + failure,
                          {{"agent", config_.agent_name}});
  }

  bool cancelled = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    statuses_ = std::move(result.statuses);
    if (state_ == LifecycleState::Discovering) {
      toolsets_ = std::move(result.toolsets);
      agent_ = std::move(agent);
      state_ = LifecycleState::Ready;
    } else {
      // shutdown() arrived while discovery was running
      cancelled = true;
    }
  }

  if (cancelled) {
    TOOLMESH_LOG_INFO("Session shut down during discovery");
    closeToolsets(result.toolsets);
    std::lock_guard<std::mutex> lock(mutex_);
    markDisconnected(statuses_);
    state_ = LifecycleState::Terminated;
    return;
  }

  TOOLMESH_LOG_INFO("Session ready with " + std::to_string(toolsetCount()) +
                    " toolset(s)");
}

void SessionOrchestrator::shutdown() {
  std::vector<discovery::Toolset> toolsets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
    case LifecycleState::Uninitialized:
    case LifecycleState::Terminated:
    case LifecycleState::ShuttingDown:
      return;
    case LifecycleState::Discovering:
      state_ = LifecycleState::ShuttingDown;
      return;
    case LifecycleState::Ready:
    case LifecycleState::Failed:
      break;
    }

    state_ = LifecycleState::ShuttingDown;
    toolsets = std::move(toolsets_);
    toolsets_.clear();
    agent_.reset();
  }

  TOOLMESH_LOG_INFO("Shutting down session (" +
                    std::to_string(toolsets.size()) + " toolset(s))");

  closeToolsets(toolsets);

  std::this_thread::sleep_for(config_.shutdown_grace_period);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    markDisconnected(statuses_);
    state_ = LifecycleState::Terminated;
  }

  TOOLMESH_LOG_INFO("Session terminated");
}

void SessionOrchestrator::closeToolsets(
    std::vector<discovery::Toolset> &toolsets) {
  for (auto &toolset : toolsets) {
    if (!toolset.connection) {
      continue;
    }
    try {
      toolset.connection->close();
      TOOLMESH_LOG_DEBUG("Closed toolset '" + toolset.server_name + "'");
    } catch (const std::exception &e) {
      TOOLMESH_LOG_WARNING("Error closing toolset '" + toolset.server_name +
                           "': " + e.what());
    }
  }
  toolsets.clear();
}

discovery::StatusMap SessionOrchestrator::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return statuses_;
}

bool SessionOrchestrator::isReady() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == LifecycleState::Ready && agent_ != nullptr;
}

LifecycleState SessionOrchestrator::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::vector<std::string> SessionOrchestrator::toolNames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  for (const auto &toolset : toolsets_) {
    for (const auto &tool : toolset.tools) {
      names.push_back(tool.name);
    }
  }
  return names;
}

std::size_t SessionOrchestrator::toolsetCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return toolsets_.size();
}

std::unique_ptr<engine::EventStream>
SessionOrchestrator::runTurn(const std::string &user_id,
                             const std::string &session_id,
                             const std::string &text, bool debug_enabled,
                             diagnostics::DiagnosticSink sink) {
  std::shared_ptr<engine::ExecutionEngine> agent;
  auto turn_flag = turn_in_progress_;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != LifecycleState::Ready || !agent_) {
      throw SessionException(SessionException::Kind::NotInitialized,
                             "Session is not ready (state: " +
                                 toString(state_) + ")");
    }
    if (turn_flag->exchange(true)) {
      throw SessionException(SessionException::Kind::TurnInProgress,
                             "A turn is already in progress");
    }
    agent = agent_;
  }

  std::unique_ptr<engine::EventSource> source;
  try {
    source = agent->run({user_id, session_id, text});
  } catch (const std::exception &e) {
    turn_flag->store(false);
    TOOLMESH_LOG_ERROR("Agent failed to start the turn: " +
                       std::string(e.what()));
    throw;
  }

  return std::make_unique<engine::EventStream>(
      std::move(source), debug_enabled, std::move(sink),
      [turn_flag]() { turn_flag->store(false); });
}

} // namespace toolmesh
