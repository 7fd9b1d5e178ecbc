#include "toolmesh/discovery/toolset_discovery.hpp"
#include "toolmesh/utils/error.hpp"
#include "toolmesh/utils/logging.hpp"

#include <algorithm>
#include <future>
#include <set>

namespace toolmesh {
namespace discovery {

ToolsetDiscovery::ToolsetDiscovery(std::shared_ptr<ToolsetConnector> connector,
                                   config::SessionConfig config)
    : connector_(std::move(connector)), config_(config), builder_(config) {}

std::vector<types::ToolDescriptor>
ToolsetDiscovery::applyAllowList(std::vector<types::ToolDescriptor> tools) const {
  if (config_.allow_list.empty()) {
    return tools;
  }

  std::set<std::string> allowed(config_.allow_list.begin(),
                                config_.allow_list.end());
  tools.erase(std::remove_if(tools.begin(), tools.end(),
                             [&allowed](const types::ToolDescriptor &tool) {
                               return allowed.count(tool.name) == 0;
                             }),
              tools.end());
  return tools;
}

DiscoveryResult
ToolsetDiscovery::discoverAll(const config::ServerDescriptors &descriptors) {
  TOOLMESH_LOG_INFO("Discovering tools on " +
                    std::to_string(descriptors.size()) + " server(s)");

  std::vector<std::future<ServerOutcome>> pending;
  pending.reserve(descriptors.size());
  for (const auto &descriptor : descriptors) {
    pending.push_back(std::async(std::launch::async,
                                 &ToolsetDiscovery::discoverServer, this,
                                 std::cref(descriptor)));
  }

  DiscoveryResult result;
  for (std::size_t i = 0; i < pending.size(); ++i) {
    ServerOutcome outcome;
    try {
      outcome = pending[i].get();
    } catch (const std::exception &e) {
      // discoverServer records its own failures; this is a last resort
      outcome.status.name = descriptors[i].name;
      outcome.status.state = ServerState::Failed;
      outcome.status.error_message = e.what();
      TOOLMESH_LOG_ERROR("Discovery of '" + descriptors[i].name +
                         "' failed: " + e.what());
    }

    result.statuses[outcome.status.name] = outcome.status;
    if (outcome.toolset) {
      result.toolsets.push_back(std::move(*outcome.toolset));
    }
  }

  std::size_t tool_total = 0;
  for (const auto &toolset : result.toolsets) {
    tool_total += toolset.tools.size();
  }

  if (result.toolsets.empty()) {
    TOOLMESH_LOG_WARNING("No toolsets discovered; continuing without tools");
  } else {
    TOOLMESH_LOG_INFO("Discovered " + std::to_string(tool_total) +
                      " tool(s) on " + std::to_string(result.toolsets.size()) +
                      " server(s)");
  }

  return result;
}

ToolsetDiscovery::ServerOutcome
ToolsetDiscovery::discoverServer(const config::ServerDescriptor &descriptor) {
  ServerOutcome outcome;
  outcome.status.name = descriptor.name;
  outcome.status.state = ServerState::Connecting;

  auto validation = validator_.validate(descriptor.name, descriptor.definition);
  if (!validation.is_valid) {
    outcome.status.state = ServerState::InvalidConfiguration;
    outcome.status.error_message = validation.error_message;
    return outcome;
  }

  transport::ConnectionParams params;
  try {
    params = builder_.build(descriptor.name, descriptor.definition);
  } catch (const ConfigurationException &e) {
    TOOLMESH_LOG_ERROR("Failed to build connection parameters for '" +
                       descriptor.name + "': " + e.what());
    outcome.status.state = ServerState::Failed;
    outcome.status.error_message = e.what();
    return outcome;
  }

  std::shared_ptr<ToolsetConnection> connection;
  try {
    connection = connector_->open(descriptor.name, params);
    auto tools = applyAllowList(connection->listTools());

    if (tools.empty()) {
      TOOLMESH_LOG_WARNING("Server '" + descriptor.name +
                           "' offers no usable tools");
      connection->close();
      outcome.status.state = ServerState::NoToolsFound;
      return outcome;
    }

    outcome.status.state = ServerState::Connected;
    outcome.status.tool_count = tools.size();
    outcome.status.connected_at = std::chrono::system_clock::now();

    std::string names;
    for (const auto &tool : tools) {
      names += (names.empty() ? "" : ", ") + tool.name;
    }
    TOOLMESH_LOG_INFO("Server '" + descriptor.name + "' provides " +
                      std::to_string(tools.size()) + " tool(s): " + names);

    outcome.toolset =
        Toolset{descriptor.name, std::move(tools), std::move(connection)};
  } catch (const std::exception &e) {
    TOOLMESH_LOG_ERROR("Connection to '" + descriptor.name +
                       "' failed: " + e.what());
    outcome.status.state = ServerState::ConnectionError;
    outcome.status.error_message = e.what();

    if (connection) {
      try {
        connection->close();
      } catch (const std::exception &close_error) {
        TOOLMESH_LOG_WARNING("Error closing '" + descriptor.name +
                             "': " + close_error.what());
      }
    }
  }

  return outcome;
}

} // namespace discovery
} // namespace toolmesh
