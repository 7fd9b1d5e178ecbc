#include "toolmesh/session/message_correlator.hpp"
#include "toolmesh/utils/error.hpp"
#include "toolmesh/utils/json_utils.hpp"
#include "toolmesh/utils/logging.hpp"

#include <iomanip>
#include <sstream>

namespace toolmesh {

namespace {

Response failure(std::optional<types::RequestId> id, types::ErrorCode code,
                 const std::string &message) {
  Response response;
  response.id = std::move(id);
  response.error = types::ErrorData{static_cast<int>(code), message, nullptr};
  return response;
}

nlohmann::json toJson(const types::JSONRPCMessage &message) {
  return std::visit([](const auto &msg) { return nlohmann::json(msg); },
                    message);
}

} // namespace

std::string toString(ConnectionState state) {
  switch (state) {
  case ConnectionState::Connected:
    return "connected";
  case ConnectionState::Disconnected:
    return "disconnected";
  case ConnectionState::Failed:
    return "failed";
  }
  return "unknown";
}

MessageCorrelator::MessageCorrelator(
    std::shared_ptr<transport::TransportFactory> factory,
    std::chrono::milliseconds default_timeout)
    : factory_(std::move(factory)), default_timeout_(default_timeout),
      message_counter_(0), rng_(std::random_device{}()) {}

MessageCorrelator::~MessageCorrelator() { shutdownAll(); }

std::string MessageCorrelator::generateMessageId() {
  uint64_t counter = ++message_counter_;

  uint32_t suffix;
  {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    suffix = static_cast<uint32_t>(rng_());
  }

  std::stringstream ss;
  ss << counter << '_' << std::hex << std::setw(8) << std::setfill('0')
     << suffix;
  return ss.str();
}

bool MessageCorrelator::connect(const std::string &server_name,
                                const transport::ConnectionParams &params) {
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(server_name);
    if (it != connections_.end() && it->second->transport) {
      TOOLMESH_LOG_WARNING("Replacing existing connection to '" + server_name +
                           "'");
    }
  }
  disconnect(server_name);

  auto connection = std::make_shared<Connection>();
  connection->info.name = server_name;
  connection->info.type = transport::kindOf(params);

  TOOLMESH_LOG_INFO("Connecting to '" + server_name + "' (" +
                    transport::describe(params) + ")");

  try {
    if (!factory_) {
      throw TransportException("No transport factory configured");
    }

    auto transport = factory_->create(params);
    if (!transport) {
      throw TransportException("Transport factory returned no transport for '" +
                               server_name + "'");
    }

    std::weak_ptr<Connection> weak = connection;
    transport->setMessageCallback(
        [this, weak](types::JSONRPCMessage message) {
          handleMessage(weak, message);
        });
    transport->setErrorCallback([this, weak](std::error_code error) {
      handleTransportError(weak, error);
    });
    transport->setCloseCallback([this, weak]() { handleTransportClosed(weak); });

    // Published before connecting so early inbound traffic finds it
    {
      std::lock_guard<std::mutex> lock(connections_mutex_);
      connection->transport = transport;
      connection->info.status = ConnectionState::Connected;
      connections_[server_name] = connection;
    }

    transport->connect();

    auto now = std::chrono::system_clock::now();
    {
      std::lock_guard<std::mutex> lock(connections_mutex_);
      connection->info.connected_at = now;
      connection->info.last_activity = now;
    }

    TOOLMESH_LOG_INFO("Connected to '" + server_name + "'");
    return true;
  } catch (const std::exception &e) {
    TOOLMESH_LOG_ERROR("Failed to connect to '" + server_name +
                       "': " + e.what());

    std::shared_ptr<transport::Transport> transport;
    {
      std::lock_guard<std::mutex> lock(connections_mutex_);
      transport = std::move(connection->transport);
      connection->info.status = ConnectionState::Failed;
      connection->info.last_error = e.what();
      connections_[server_name] = connection;
    }

    if (transport) {
      try {
        transport->disconnect();
      } catch (const std::exception &cleanup_error) {
        TOOLMESH_LOG_WARNING("Cleanup after failed connect to '" +
                             server_name + "' failed: " + cleanup_error.what());
      }
    }
    return false;
  }
}

Response MessageCorrelator::sendRequest(
    const std::string &server_name, const std::string &method,
    const std::optional<nlohmann::json> &params,
    std::optional<std::chrono::milliseconds> timeout) {
  auto wait = timeout.value_or(default_timeout_);
  auto started = std::chrono::steady_clock::now();

  std::shared_ptr<Connection> connection;
  std::shared_ptr<transport::Transport> transport;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(server_name);
    if (it != connections_.end() &&
        it->second->info.status == ConnectionState::Connected) {
      connection = it->second;
      transport = connection->transport;
    }
  }

  if (!connection || !transport) {
    TOOLMESH_LOG_WARNING("No active connection to server '" + server_name +
                         "' for " + method);
    return failure(std::nullopt, types::ErrorCode::NoActiveConnection,
                   "No active connection to server '" + server_name + "'");
  }

  std::string id = generateMessageId();

  std::future<Response> future;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    PendingMessage pending{method, started, {}};
    future = pending.promise.get_future();
    connection->pending.emplace(id, std::move(pending));
    connection->info.last_activity = std::chrono::system_clock::now();
  }

  types::JSONRPCRequest request;
  request.id = id;
  request.method = method;
  request.params = params;

  TOOLMESH_LOG_DEBUG("Sending " + method + " [" + id + "] to '" + server_name +
                     "'");

  std::error_code ec = transport->send(request, wait);
  if (ec) {
    {
      std::lock_guard<std::mutex> lock(connections_mutex_);
      connection->pending.erase(id);
      connection->info.last_error = ec.message();
    }
    TOOLMESH_LOG_ERROR("Failed to send " + method + " to '" + server_name +
                       "': " + ec.message());
    return failure(id, types::ErrorCode::TransportError,
                   "Failed to send '" + method + "' to '" + server_name +
                       "': " + ec.message());
  }

  auto remaining = wait - std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - started);
  if (remaining < std::chrono::milliseconds::zero()) {
    remaining = std::chrono::milliseconds::zero();
  }

  if (future.wait_for(remaining) == std::future_status::timeout) {
    {
      std::lock_guard<std::mutex> lock(connections_mutex_);
      connection->pending.erase(id);
    }
    // The response may have landed between wait_for and erase
    if (future.wait_for(std::chrono::milliseconds::zero()) !=
        std::future_status::ready) {
      TOOLMESH_LOG_WARNING("Request " + method + " [" + id + "] to '" +
                           server_name + "' timed out");
      return failure(id, types::ErrorCode::TimeoutError,
                     "Request '" + method + "' to '" + server_name +
                         "' timed out after " + std::to_string(wait.count()) +
                         "ms");
    }
  }

  return future.get();
}

void MessageCorrelator::sendNotification(
    const std::string &server_name, const std::string &method,
    const std::optional<nlohmann::json> &params) {
  std::shared_ptr<transport::Transport> transport;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(server_name);
    if (it != connections_.end() &&
        it->second->info.status == ConnectionState::Connected) {
      transport = it->second->transport;
      it->second->info.last_activity = std::chrono::system_clock::now();
    }
  }

  if (!transport) {
    TOOLMESH_LOG_WARNING("Dropping notification " + method +
                         ": no active connection to server '" + server_name +
                         "'");
    return;
  }

  types::JSONRPCNotification notification;
  notification.method = method;
  notification.params = params;

  transport->send(notification, [server_name, method](
                                    const std::error_code &ec) {
    if (ec) {
      TOOLMESH_LOG_ERROR("Failed to send notification " + method + " to '" +
                         server_name + "': " + ec.message());
    }
  });
}

void MessageCorrelator::registerHandler(const std::string &method,
                                        MethodHandler handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  if (handlers_.count(method)) {
    TOOLMESH_LOG_DEBUG("Replacing handler for " + method);
  }
  handlers_[method] = std::move(handler);
}

std::optional<Response>
MessageCorrelator::dispatchIncoming(const nlohmann::json &message) {
  if (!message.is_object()) {
    TOOLMESH_LOG_WARNING("Ignoring inbound message that is not an object");
    return std::nullopt;
  }

  bool has_id = message.contains("id") && !message["id"].is_null();

  if (!message.contains("method") || !message["method"].is_string()) {
    TOOLMESH_LOG_WARNING("Ignoring inbound message without a method");
    return std::nullopt;
  }
  std::string method = message["method"].get<std::string>();

  MethodHandler handler;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    auto it = handlers_.find(method);
    if (it != handlers_.end()) {
      handler = it->second;
    }
  }

  if (!handler) {
    // An unhandled request gets no reply at all, not a MethodNotFound error
    TOOLMESH_LOG_WARNING("No handler registered for " + method +
                         (has_id ? " (request left unanswered)" : ""));
    return std::nullopt;
  }

  nlohmann::json params =
      message.contains("params") ? message["params"] : nlohmann::json::object();

  if (!has_id) {
    try {
      handler(params);
    } catch (const std::exception &e) {
      TOOLMESH_LOG_ERROR("Handler for notification " + method +
                         " failed: " + e.what());
    }
    return std::nullopt;
  }

  types::RequestId id;
  try {
    id = message["id"].get<types::RequestId>();
  } catch (const nlohmann::json::exception &e) {
    TOOLMESH_LOG_WARNING("Ignoring request " + method +
                         " with an unusable id: " + e.what());
    return std::nullopt;
  }

  Response response;
  response.id = id;
  try {
    response.result = handler(params);
  } catch (const ToolmeshException &e) {
    TOOLMESH_LOG_ERROR("Handler for " + method + " failed: " + e.what());
    response.error = e.error();
  } catch (const std::exception &e) {
    TOOLMESH_LOG_ERROR("Handler for " + method + " failed: " + e.what());
    response.error = types::ErrorData{
        static_cast<int>(types::ErrorCode::InternalError), e.what(), nullptr};
  }
  return response;
}

void MessageCorrelator::disconnect(const std::string &server_name) {
  std::shared_ptr<transport::Transport> transport;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(server_name);
    if (it == connections_.end()) {
      TOOLMESH_LOG_DEBUG("Attempted to disconnect unknown server '" +
                         server_name + "'");
      return;
    }

    auto &connection = *it->second;
    transport = std::move(connection.transport);
    if (connection.info.status == ConnectionState::Connected) {
      connection.info.status = ConnectionState::Disconnected;
    }
    abandonPending(connection, "Connection to '" + server_name + "' closed");
  }

  if (transport) {
    try {
      transport->disconnect();
    } catch (const std::exception &e) {
      TOOLMESH_LOG_WARNING("Error closing connection to '" + server_name +
                           "': " + e.what());
    }
    TOOLMESH_LOG_INFO("Disconnected from '" + server_name + "'");
  }
}

void MessageCorrelator::shutdownAll() {
  std::vector<std::string> names;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (const auto &[name, connection] : connections_) {
      if (connection->transport) {
        names.push_back(name);
      }
    }
  }

  for (const auto &name : names) {
    disconnect(name);
  }
}

std::map<std::string, ConnectionInfo>
MessageCorrelator::connectionStatus() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  std::map<std::string, ConnectionInfo> result;
  for (const auto &[name, connection] : connections_) {
    result[name] = connection->info;
  }
  return result;
}

bool MessageCorrelator::isConnected(const std::string &server_name) const {
  std::shared_ptr<transport::Transport> transport;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(server_name);
    if (it == connections_.end() ||
        it->second->info.status != ConnectionState::Connected) {
      return false;
    }
    transport = it->second->transport;
  }
  return transport && transport->isConnected();
}

std::size_t MessageCorrelator::pendingCount() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  std::size_t count = 0;
  for (const auto &[name, connection] : connections_) {
    count += connection->pending.size();
  }
  return count;
}

void MessageCorrelator::handleMessage(const std::weak_ptr<Connection> &weak,
                                      const types::JSONRPCMessage &message) {
  if (const auto *response = std::get_if<types::JSONRPCResponse>(&message)) {
    resolvePending(weak, response->id,
                   Response{response->id, response->result, std::nullopt});
    return;
  }

  if (const auto *error = std::get_if<types::JSONRPCError>(&message)) {
    resolvePending(weak, error->id, Response{error->id, nullptr, error->error});
    return;
  }

  // Inbound request or notification from the server
  auto reply = dispatchIncoming(toJson(message));
  if (!reply || !reply->id) {
    return;
  }

  std::shared_ptr<transport::Transport> transport;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    if (auto connection = weak.lock()) {
      transport = connection->transport;
    }
  }
  if (!transport) {
    return;
  }

  types::JSONRPCMessage outbound;
  if (reply->error) {
    outbound = createErrorResponse(*reply->id, *reply->error);
  } else {
    outbound = types::JSONRPCResponse{"2.0", *reply->id, reply->result};
  }

  transport->send(outbound, [](const std::error_code &ec) {
    if (ec) {
      TOOLMESH_LOG_ERROR("Failed to send response: " + ec.message());
    }
  });
}

void MessageCorrelator::resolvePending(const std::weak_ptr<Connection> &weak,
                                       const types::RequestId &id,
                                       Response response) {
  std::string key = types::idToString(id);

  std::lock_guard<std::mutex> lock(connections_mutex_);
  auto connection = weak.lock();
  if (!connection) {
    return;
  }

  auto it = connection->pending.find(key);
  if (it == connection->pending.end()) {
    TOOLMESH_LOG_WARNING("Received response for unknown request ID: " + key);
    return;
  }

  connection->info.last_activity = std::chrono::system_clock::now();
  if (response.error) {
    connection->info.last_error = response.error->message;
  }
  it->second.promise.set_value(std::move(response));
  connection->pending.erase(it);
}

void MessageCorrelator::handleTransportError(
    const std::weak_ptr<Connection> &weak, const std::error_code &error) {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  if (auto connection = weak.lock()) {
    TOOLMESH_LOG_ERROR("Transport error on '" + connection->info.name +
                       "': " + error.message());
    connection->info.last_error = error.message();
  }
}

void MessageCorrelator::handleTransportClosed(
    const std::weak_ptr<Connection> &weak) {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  auto connection = weak.lock();
  if (!connection) {
    return;
  }

  if (connection->info.status == ConnectionState::Connected) {
    TOOLMESH_LOG_WARNING("Connection to '" + connection->info.name +
                         "' closed by the server");
    connection->info.status = ConnectionState::Disconnected;
  }
  abandonPending(*connection,
                 "Connection to '" + connection->info.name + "' closed");
}

void MessageCorrelator::abandonPending(Connection &connection,
                                       const std::string &reason) {
  for (auto &[id, pending] : connection.pending) {
    TOOLMESH_LOG_DEBUG("Abandoning " + pending.method + " [" + id + "]");
    pending.promise.set_value(
        failure(types::RequestId(id), types::ErrorCode::TransportError, reason));
  }
  connection.pending.clear();
}

} // namespace toolmesh
