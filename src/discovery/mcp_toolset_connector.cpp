#include "toolmesh/discovery/mcp_toolset_connector.hpp"
#include "toolmesh/utils/error.hpp"
#include "toolmesh/utils/logging.hpp"

namespace toolmesh {
namespace discovery {

nlohmann::json unwrapResponse(const Response &response) {
  if (!response.error) {
    return response.result;
  }

  const auto &error = *response.error;
  switch (static_cast<types::ErrorCode>(error.code)) {
  case types::ErrorCode::TimeoutError:
    throw TimeoutException(error.message, error.data);
  case types::ErrorCode::TransportError:
  case types::ErrorCode::NoActiveConnection:
    throw TransportException(static_cast<types::ErrorCode>(error.code),
                             error.message, error.data);
  default:
    throw ProtocolException(error);
  }
}

McpToolsetConnection::McpToolsetConnection(
    std::shared_ptr<MessageCorrelator> correlator, std::string server_name,
    std::chrono::milliseconds request_timeout)
    : correlator_(std::move(correlator)), server_name_(std::move(server_name)),
      request_timeout_(request_timeout), closed_(false) {}

McpToolsetConnection::~McpToolsetConnection() { close(); }

nlohmann::json McpToolsetConnection::request(const std::string &method,
                                             const nlohmann::json &params,
                                             std::chrono::milliseconds timeout) {
  if (closed_) {
    throw TransportException(types::ErrorCode::NoActiveConnection,
                             "Connection to '" + server_name_ +
                                 "' is closed");
  }
  return unwrapResponse(
      correlator_->sendRequest(server_name_, method, params, timeout));
}

nlohmann::json
McpToolsetConnection::initialize(const std::string &client_name,
                                 const std::string &client_version,
                                 std::chrono::milliseconds timeout) {
  nlohmann::json params = {
      {"protocolVersion", kProtocolVersion},
      {"capabilities", nlohmann::json::object()},
      {"clientInfo", {{"name", client_name}, {"version", client_version}}}};

  nlohmann::json result = request("initialize", params, timeout);

  if (result.contains("serverInfo")) {
    TOOLMESH_LOG_INFO("Server '" + server_name_ + "' is " +
                      result["serverInfo"].value("name", std::string("?")) +
                      " " +
                      result["serverInfo"].value("version", std::string()));
  }

  correlator_->sendNotification(server_name_, "notifications/initialized");
  return result;
}

std::vector<types::ToolDescriptor> McpToolsetConnection::listTools() {
  std::vector<types::ToolDescriptor> tools;
  std::optional<std::string> cursor;

  do {
    nlohmann::json params = nlohmann::json::object();
    if (cursor) {
      params["cursor"] = *cursor;
    }

    nlohmann::json result = request("tools/list", params, request_timeout_);
    if (!result.is_object() || !result.contains("tools") ||
        !result["tools"].is_array()) {
      throw ProtocolException(types::ErrorCode::InvalidRequest,
                              "Malformed tools/list result from '" +
                                  server_name_ + "'");
    }

    try {
      for (const auto &tool : result["tools"]) {
        tools.push_back(tool.get<types::ToolDescriptor>());
      }
    } catch (const nlohmann::json::exception &e) {
      throw ProtocolException(types::ErrorCode::InvalidRequest,
                              "Malformed tool descriptor from '" +
                                  server_name_ + "': " + e.what());
    }

    cursor.reset();
    if (result.contains("nextCursor") && result["nextCursor"].is_string()) {
      cursor = result["nextCursor"].get<std::string>();
    }
  } while (cursor);

  return tools;
}

nlohmann::json McpToolsetConnection::callTool(const std::string &name,
                                              const nlohmann::json &arguments) {
  TOOLMESH_LOG_DEBUG("Calling " + name + " on '" + server_name_ + "'");
  return request("tools/call", {{"name", name}, {"arguments", arguments}},
                 request_timeout_);
}

void McpToolsetConnection::close() {
  if (closed_.exchange(true)) {
    return;
  }
  correlator_->disconnect(server_name_);
}

const std::string &McpToolsetConnection::serverName() const {
  return server_name_;
}

McpToolsetConnector::McpToolsetConnector(
    std::shared_ptr<MessageCorrelator> correlator, config::SessionConfig config)
    : correlator_(std::move(correlator)), config_(std::move(config)) {
  correlator_->registerHandler(
      "ping", [](const nlohmann::json &) { return nlohmann::json::object(); });
  correlator_->registerHandler(
      "notifications/message", [](const nlohmann::json &params) {
        TOOLMESH_LOG_INFO("Server log: " + params.value("data", nlohmann::json())
                                               .dump());
        return nlohmann::json();
      });
}

std::shared_ptr<ToolsetConnection>
McpToolsetConnector::open(const std::string &server_name,
                          const transport::ConnectionParams &params) {
  if (!correlator_->connect(server_name, params)) {
    auto statuses = correlator_->connectionStatus();
    auto it = statuses.find(server_name);
    std::string reason = it != statuses.end() && it->second.last_error
                             ? *it->second.last_error
                             : "connection failed";
    throw TransportException("Cannot connect to '" + server_name +
                             "': " + reason);
  }

  auto connection = std::make_shared<McpToolsetConnection>(
      correlator_, server_name, config_.request_timeout);

  try {
    connection->initialize(config_.client_name, config_.client_version,
                           config_.connection_timeout);
  } catch (const std::exception &) {
    connection->close();
    throw;
  }

  return connection;
}

} // namespace discovery
} // namespace toolmesh
