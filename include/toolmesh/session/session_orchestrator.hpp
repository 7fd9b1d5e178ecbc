#ifndef TOOLMESH_SESSION_SESSION_ORCHESTRATOR_HPP_
#define TOOLMESH_SESSION_SESSION_ORCHESTRATOR_HPP_

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "toolmesh/config/server_descriptor.hpp"
#include "toolmesh/config/session_config.hpp"
#include "toolmesh/discovery/toolset_discovery.hpp"
#include "toolmesh/engine/event_stream.hpp"
#include "toolmesh/engine/execution_engine.hpp"

namespace toolmesh {

/**
 * @brief Lifecycle of a session
 *
 * uninitialized -> discovering -> ready -> shutting_down -> terminated,
 * or discovering -> failed when no engine can be built.
 */
enum class LifecycleState {
  Uninitialized,
  Discovering,
  Ready,
  ShuttingDown,
  Terminated,
  Failed
};

std::string toString(LifecycleState state);

/**
 * @brief Owns discovery, the aggregated toolsets and the agent bound to them
 */
class SessionOrchestrator {
public:
  SessionOrchestrator(std::shared_ptr<discovery::ToolsetConnector> connector,
                      std::shared_ptr<engine::AgentFactory> agent_factory,
                      config::ServerDescriptors descriptors,
                      config::SessionConfig config);

  /**
   * @brief Shuts down if still running
   */
  ~SessionOrchestrator();

  SessionOrchestrator(const SessionOrchestrator &) = delete;
  SessionOrchestrator &operator=(const SessionOrchestrator &) = delete;

  /**
   * @brief Discover toolsets and bind them to a new agent
   *
   * A no-op (with a warning) unless the session is uninitialized or failed.
   *
   * @throws EngineException if the agent cannot be built; the session is then
   * failed and every discovered toolset has been closed
   */
  void start();

  /**
   * @brief Close every toolset and drop the agent
   *
   * Close failures are logged and do not stop the remaining closes. Waits
   * the configured grace period before reporting terminated. A no-op when
   * uninitialized or already terminated.
   */
  void shutdown();

  /**
   * @brief Per-server status from the last discovery
   */
  discovery::StatusMap status() const;

  bool isReady() const;

  LifecycleState state() const;

  /**
   * @brief Names of all tools bound to the agent, server by server
   */
  std::vector<std::string> toolNames() const;

  std::size_t toolsetCount() const;

  /**
   * @brief Run one user turn
   *
   * @param user_id The user identifier
   * @param session_id The session identifier
   * @param text The user input
   * @param debug_enabled Whether to emit diagnostic records for this turn
   * @param sink Where diagnostic records go
   * @return The turn's classified event stream
   * @throws SessionException NotInitialized unless ready, TurnInProgress
   * while an earlier stream is still open
   */
  std::unique_ptr<engine::EventStream>
  runTurn(const std::string &user_id, const std::string &session_id,
          const std::string &text, bool debug_enabled = false,
          diagnostics::DiagnosticSink sink = {});

private:
  void closeToolsets(std::vector<discovery::Toolset> &toolsets);

  std::shared_ptr<discovery::ToolsetConnector> connector_;
  std::shared_ptr<engine::AgentFactory> agent_factory_;
  config::ServerDescriptors descriptors_;
  config::SessionConfig config_;

  LifecycleState state_;
  std::vector<discovery::Toolset> toolsets_;
  discovery::StatusMap statuses_;
  std::shared_ptr<engine::ExecutionEngine> agent_;
  std::shared_ptr<std::atomic<bool>> turn_in_progress_;
  mutable std::mutex mutex_;
};

} // namespace toolmesh

#endif // TOOLMESH_SESSION_SESSION_ORCHESTRATOR_HPP_
