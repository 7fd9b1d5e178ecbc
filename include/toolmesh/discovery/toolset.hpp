#ifndef TOOLMESH_DISCOVERY_TOOLSET_HPP_
#define TOOLMESH_DISCOVERY_TOOLSET_HPP_

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolmesh/transport/connection_params.hpp"
#include "toolmesh/types.hpp"

namespace toolmesh {
namespace discovery {

/**
 * @brief Discovery outcome for one configured server
 */
enum class ServerState {
  Disconnected,
  Connecting,
  Connected,
  InvalidConfiguration,
  NoToolsFound,
  ConnectionError,
  Failed
};

/**
 * @brief snake_case name of a state, as shown in status output
 */
std::string toString(ServerState state);

/**
 * @brief Per-server status record kept by discovery
 */
struct ConnectionStatus {
  std::string name;
  ServerState state = ServerState::Disconnected;
  std::size_t tool_count = 0;
  std::optional<std::string> error_message;
  std::optional<std::chrono::system_clock::time_point> connected_at;
};

using StatusMap = std::map<std::string, ConnectionStatus>;

nlohmann::json toJson(const ConnectionStatus &status);

nlohmann::json toJson(const StatusMap &statuses);

/**
 * @brief A live connection through which one server's tools are used
 */
class ToolsetConnection {
public:
  virtual ~ToolsetConnection() = default;

  /**
   * @brief Fetch the server's tool catalog
   *
   * @throws ToolmeshException on transport or protocol failure
   */
  virtual std::vector<types::ToolDescriptor> listTools() = 0;

  /**
   * @brief Invoke one tool
   *
   * @param name The tool name
   * @param arguments The tool arguments
   * @return nlohmann::json The tool result as sent by the server
   * @throws ToolmeshException on transport or protocol failure
   */
  virtual nlohmann::json callTool(const std::string &name,
                                  const nlohmann::json &arguments) = 0;

  /**
   * @brief Release the connection; calling it twice is harmless
   */
  virtual void close() = 0;
};

/**
 * @brief Opens toolset connections from connection parameters
 */
class ToolsetConnector {
public:
  virtual ~ToolsetConnector() = default;

  /**
   * @brief Open a ready-to-use connection to one server
   *
   * @throws ToolmeshException if the server cannot be reached or refuses the
   * handshake
   */
  virtual std::shared_ptr<ToolsetConnection>
  open(const std::string &server_name,
       const transport::ConnectionParams &params) = 0;
};

/**
 * @brief Filtered tools of one connected server plus the connection to them
 */
struct Toolset {
  std::string server_name;
  std::vector<types::ToolDescriptor> tools;
  std::shared_ptr<ToolsetConnection> connection;

  bool hasTool(const std::string &tool_name) const;
};

} // namespace discovery
} // namespace toolmesh

#endif // TOOLMESH_DISCOVERY_TOOLSET_HPP_
