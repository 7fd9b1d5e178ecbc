#ifndef TOOLMESH_SESSION_SESSION_HPP_
#define TOOLMESH_SESSION_SESSION_HPP_

#include <atomic>
#include <memory>
#include <string>

#include "toolmesh/config/config_loader.hpp"
#include "toolmesh/engine/event_stream.hpp"
#include "toolmesh/session/message_correlator.hpp"
#include "toolmesh/session/session_orchestrator.hpp"
#include "toolmesh/utils/diagnostics.hpp"

namespace toolmesh {

namespace detail {

// Defined outside Session so its default member initializers are complete
// where Session uses `Options options = {}` as a default argument.
struct SessionOptions {
  std::string app_identifier = "universal_mcp_interface";
  std::string user_identifier = "cli_user_001";
  std::string session_identifier = "cli_session_001";
  bool debug_enabled = false;

  /**
   * @brief Receives diagnostic records while debug is on; when empty they
   * are logged instead
   */
  diagnostics::DiagnosticSink diagnostic_sink;
};

} // namespace detail

/**
 * @brief What a front-end drives: identifiers, debug toggle and one
 * orchestrator
 *
 * The Session is responsible for:
 * - Establishing the orchestrator (discovery and agent creation)
 * - Running user turns with the session's identifiers
 * - Exposing a status snapshot for display
 * - Orderly termination
 */
class Session {
public:
  /**
   * @brief Identifiers and initial settings
   */
  using Options = detail::SessionOptions;

  /**
   * @brief Construct a session around an existing orchestrator
   *
   * @param orchestrator The orchestrator to drive
   * @param options Identifiers and settings
   * @param correlator Shut down on terminate() when given
   */
  Session(std::unique_ptr<SessionOrchestrator> orchestrator, Options options,
          std::shared_ptr<MessageCorrelator> correlator = nullptr);

  /**
   * @brief Build a session wired to real tool servers
   *
   * Reads the server descriptors and session settings from the loader and
   * connects through a MessageCorrelator with the default transports.
   *
   * @throws ConfigurationException if the configuration cannot be loaded
   */
  static std::unique_ptr<Session>
  create(config::ConfigLoader &loader,
         std::shared_ptr<engine::AgentFactory> agent_factory,
         Options options = {});

  ~Session();

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  /**
   * @brief Run discovery and bind the agent
   *
   * @throws EngineException if the agent cannot be built
   */
  void establish();

  /**
   * @brief Run one turn with this session's identifiers
   *
   * @throws SessionException if the session is not ready or a turn is open
   */
  std::unique_ptr<engine::EventStream>
  processUserInput(const std::string &text);

  /**
   * @brief Read-only snapshot for display
   *
   * @return JSON object with `ready`, `debugEnabled`, `perServerStatus`,
   * `lifecycleState`, `tools` and the three identifiers
   */
  nlohmann::json statusSnapshot() const;

  void setDebugEnabled(bool enabled);

  /**
   * @brief Flip the debug flag
   *
   * @return The new value
   */
  bool toggleDebug();

  bool debugEnabled() const;

  /**
   * @brief Shut down the orchestrator and every connection; idempotent
   */
  void terminate();

  LifecycleState lifecycleState() const;

  const Options &options() const;

private:
  void emitDiagnostic(const diagnostics::DiagnosticRecord &record) const;

  std::unique_ptr<SessionOrchestrator> orchestrator_;
  Options options_;
  std::shared_ptr<MessageCorrelator> correlator_;
  std::atomic<bool> debug_enabled_;
};

} // namespace toolmesh

#endif // TOOLMESH_SESSION_SESSION_HPP_
