#ifndef TOOLMESH_DISCOVERY_TOOLSET_DISCOVERY_HPP_
#define TOOLMESH_DISCOVERY_TOOLSET_DISCOVERY_HPP_

#include "toolmesh/config/configuration_validator.hpp"
#include "toolmesh/config/connection_builder.hpp"
#include "toolmesh/config/server_descriptor.hpp"
#include "toolmesh/config/session_config.hpp"
#include "toolmesh/discovery/toolset.hpp"

namespace toolmesh {
namespace discovery {

/**
 * @brief Toolsets contributed by the configured servers and their statuses
 */
struct DiscoveryResult {
  std::vector<Toolset> toolsets; ///< In descriptor order
  StatusMap statuses;            ///< One entry per configured server
};

/**
 * @brief Connects to every configured server and collects its tools
 *
 * Servers are handled concurrently and in isolation: whatever goes wrong
 * with one of them ends up in its status entry and nowhere else.
 */
class ToolsetDiscovery {
public:
  ToolsetDiscovery(std::shared_ptr<ToolsetConnector> connector,
                   config::SessionConfig config);

  /**
   * @brief Discover all servers
   *
   * @param descriptors The configured servers
   * @return DiscoveryResult Toolsets and exactly one status per server
   */
  DiscoveryResult discoverAll(const config::ServerDescriptors &descriptors);

  /**
   * @brief Keep the tools named in the allow-list (all when it is empty)
   */
  std::vector<types::ToolDescriptor>
  applyAllowList(std::vector<types::ToolDescriptor> tools) const;

private:
  struct ServerOutcome {
    ConnectionStatus status;
    std::optional<Toolset> toolset;
  };

  ServerOutcome discoverServer(const config::ServerDescriptor &descriptor);

  std::shared_ptr<ToolsetConnector> connector_;
  config::SessionConfig config_;
  config::ConfigurationValidator validator_;
  config::ConnectionBuilder builder_;
};

} // namespace discovery
} // namespace toolmesh

#endif // TOOLMESH_DISCOVERY_TOOLSET_DISCOVERY_HPP_
