#ifndef TOOLMESH_CONFIG_SESSION_CONFIG_HPP_
#define TOOLMESH_CONFIG_SESSION_CONFIG_HPP_

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace toolmesh {
namespace config {

/**
 * @brief Settings shared by every server and turn of one session
 */
struct SessionConfig {
  /**
   * @brief Tool names to expose; empty exposes every discovered tool
   */
  std::vector<std::string> allow_list;

  /**
   * @brief Budget for opening one server connection (handshake included)
   */
  std::chrono::milliseconds connection_timeout = std::chrono::seconds(30);

  /**
   * @brief Budget for one correlated request
   */
  std::chrono::milliseconds request_timeout = std::chrono::seconds(30);

  /**
   * @brief Base directory for relative script arguments
   */
  std::filesystem::path project_root;

  /**
   * @brief Arguments ending in this extension are treated as script paths
   */
  std::string script_extension = ".py";

  /**
   * @brief Delay after closing toolsets before shutdown completes
   */
  std::chrono::milliseconds shutdown_grace_period =
      std::chrono::milliseconds(500);

  std::string agent_name = "toolmesh_assistant";
  std::string model_name = "gemini-2.0-flash-exp";
  std::string system_instruction =
      "You are a helpful assistant with access to tools provided by the "
      "connected servers. Use them when they help answer the request.";

  std::string client_name = "toolmesh";
  std::string client_version = "0.1.0";
};

/**
 * @brief Project root from TOOLMESH_PROJECT_ROOT, else the working directory
 */
std::filesystem::path defaultProjectRoot();

/**
 * @brief Defaults with the project root filled in
 */
SessionConfig defaultSessionConfig();

/**
 * @brief Overlay the keys of a `session` config section onto a base config
 *
 * Timeouts are given in seconds (`connectionTimeout`, `requestTimeout`) or
 * milliseconds (`shutdownGracePeriodMs`). Unknown keys are ignored.
 */
SessionConfig sessionConfigFromJson(const nlohmann::json &section,
                                    SessionConfig base = defaultSessionConfig());

} // namespace config
} // namespace toolmesh

#endif // TOOLMESH_CONFIG_SESSION_CONFIG_HPP_
