#include "toolmesh/discovery/toolset.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace toolmesh {
namespace discovery {

namespace {

std::string formatTime(std::chrono::system_clock::time_point time) {
  auto seconds = std::chrono::system_clock::to_time_t(time);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

} // namespace

std::string toString(ServerState state) {
  switch (state) {
  case ServerState::Disconnected:
    return "disconnected";
  case ServerState::Connecting:
    return "connecting";
  case ServerState::Connected:
    return "connected";
  case ServerState::InvalidConfiguration:
    return "invalid_configuration";
  case ServerState::NoToolsFound:
    return "no_tools_found";
  case ServerState::ConnectionError:
    return "connection_error";
  case ServerState::Failed:
    return "failed";
  }
  return "unknown";
}

nlohmann::json toJson(const ConnectionStatus &status) {
  nlohmann::json j = {{"name", status.name},
                      {"status", toString(status.state)},
                      {"tool_count", status.tool_count}};
  j["error_message"] = status.error_message ? nlohmann::json(*status.error_message)
                                            : nlohmann::json(nullptr);
  j["connection_time"] = status.connected_at
                             ? nlohmann::json(formatTime(*status.connected_at))
                             : nlohmann::json(nullptr);
  return j;
}

nlohmann::json toJson(const StatusMap &statuses) {
  nlohmann::json j = nlohmann::json::object();
  for (const auto &[name, status] : statuses) {
    j[name] = toJson(status);
  }
  return j;
}

bool Toolset::hasTool(const std::string &tool_name) const {
  return std::any_of(tools.begin(), tools.end(),
                     [&tool_name](const types::ToolDescriptor &tool) {
                       return tool.name == tool_name;
                     });
}

} // namespace discovery
} // namespace toolmesh
