#ifndef TOOLMESH_DISCOVERY_MCP_TOOLSET_CONNECTOR_HPP_
#define TOOLMESH_DISCOVERY_MCP_TOOLSET_CONNECTOR_HPP_

#include "toolmesh/config/session_config.hpp"
#include "toolmesh/discovery/toolset.hpp"
#include "toolmesh/session/message_correlator.hpp"

namespace toolmesh {
namespace discovery {

/**
 * @brief Protocol revision announced in the initialize request
 */
constexpr const char *kProtocolVersion = "2024-11-05";

/**
 * @brief Toolset connection speaking MCP through a MessageCorrelator
 */
class McpToolsetConnection : public ToolsetConnection {
public:
  McpToolsetConnection(std::shared_ptr<MessageCorrelator> correlator,
                       std::string server_name,
                       std::chrono::milliseconds request_timeout);

  ~McpToolsetConnection() override;

  /**
   * @brief Run the initialize / notifications/initialized handshake
   *
   * @return nlohmann::json The server's initialize result
   * @throws ToolmeshException if the server rejects or ignores the request
   */
  nlohmann::json initialize(const std::string &client_name,
                            const std::string &client_version,
                            std::chrono::milliseconds timeout);

  std::vector<types::ToolDescriptor> listTools() override;

  nlohmann::json callTool(const std::string &name,
                          const nlohmann::json &arguments) override;

  void close() override;

  const std::string &serverName() const;

private:
  nlohmann::json request(const std::string &method,
                         const nlohmann::json &params,
                         std::chrono::milliseconds timeout);

  std::shared_ptr<MessageCorrelator> correlator_;
  std::string server_name_;
  std::chrono::milliseconds request_timeout_;
  std::atomic<bool> closed_;
};

/**
 * @brief Production connector: one correlated MCP connection per server
 */
class McpToolsetConnector : public ToolsetConnector {
public:
  McpToolsetConnector(std::shared_ptr<MessageCorrelator> correlator,
                      config::SessionConfig config);

  std::shared_ptr<ToolsetConnection>
  open(const std::string &server_name,
       const transport::ConnectionParams &params) override;

private:
  std::shared_ptr<MessageCorrelator> correlator_;
  config::SessionConfig config_;
};

/**
 * @brief Turn an error Response into the matching exception
 *
 * @return The result when the response is a success
 */
nlohmann::json unwrapResponse(const Response &response);

} // namespace discovery
} // namespace toolmesh

#endif // TOOLMESH_DISCOVERY_MCP_TOOLSET_CONNECTOR_HPP_
