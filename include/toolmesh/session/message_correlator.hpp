#ifndef TOOLMESH_SESSION_MESSAGE_CORRELATOR_HPP_
#define TOOLMESH_SESSION_MESSAGE_CORRELATOR_HPP_

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

#include "toolmesh/transport/connection_params.hpp"
#include "toolmesh/transport/transport.hpp"
#include "toolmesh/transport/transport_factory.hpp"
#include "toolmesh/types.hpp"

namespace toolmesh {

/**
 * @brief Lifecycle of one correlated connection
 */
enum class ConnectionState { Connected, Disconnected, Failed };

std::string toString(ConnectionState state);

/**
 * @brief What the correlator knows about one server connection
 */
struct ConnectionInfo {
  std::string name;
  transport::TransportKind type = transport::TransportKind::Process;
  ConnectionState status = ConnectionState::Disconnected;
  std::optional<std::chrono::system_clock::time_point> connected_at;
  std::optional<std::chrono::system_clock::time_point> last_activity;
  std::optional<std::string> last_error;
};

/**
 * @brief Outcome of a correlated request, or of dispatching an inbound one
 *
 * Exactly one of `result` and `error` is meaningful: `error` is set on
 * failure. `id` is absent only when no request was ever put on the wire.
 */
struct Response {
  std::optional<types::RequestId> id;
  nlohmann::json result;
  std::optional<types::ErrorData> error;

  bool ok() const { return !error.has_value(); }
};

/**
 * @brief Handler for an inbound method; the return value is the result
 */
using MethodHandler = std::function<nlohmann::json(const nlohmann::json &)>;

/**
 * @brief Correlates requests and responses across a set of named servers
 *
 * Each server gets its own transport, created through the TransportFactory.
 * Outbound requests carry an id of the form `<counter>_<8 hex digits>` and
 * wait for the response with the same id. Inbound requests and
 * notifications are routed to handlers registered by method name; replies
 * to inbound requests are sent back over the transport they arrived on.
 */
class MessageCorrelator {
public:
  explicit MessageCorrelator(
      std::shared_ptr<transport::TransportFactory> factory =
          std::make_shared<transport::DefaultTransportFactory>(),
      std::chrono::milliseconds default_timeout = std::chrono::seconds(30));

  /**
   * @brief Disconnects every server
   */
  ~MessageCorrelator();

  MessageCorrelator(const MessageCorrelator &) = delete;
  MessageCorrelator &operator=(const MessageCorrelator &) = delete;

  /**
   * @brief Open a connection to a server
   *
   * An existing connection under the same name is closed first.
   *
   * @param server_name The server name
   * @param params How to reach it
   * @return true on success; false (status Failed, error recorded) otherwise
   */
  bool connect(const std::string &server_name,
               const transport::ConnectionParams &params);

  /**
   * @brief Send a request and wait for the correlated response
   *
   * Never throws for transport or protocol failures; they come back in
   * `Response::error` (NoActiveConnection, TransportError, TimeoutError, or
   * the error sent by the server).
   *
   * @param server_name The server to address
   * @param method The method name
   * @param params The method parameters
   * @param timeout Overrides the default request timeout
   * @return Response The correlated response
   */
  Response sendRequest(const std::string &server_name,
                       const std::string &method,
                       const std::optional<nlohmann::json> &params =
                           std::nullopt,
                       std::optional<std::chrono::milliseconds> timeout =
                           std::nullopt);

  /**
   * @brief Send a notification; failures are logged only
   */
  void sendNotification(const std::string &server_name,
                        const std::string &method,
                        const std::optional<nlohmann::json> &params =
                            std::nullopt);

  /**
   * @brief Register the handler for an inbound method (last one wins)
   */
  void registerHandler(const std::string &method, MethodHandler handler);

  /**
   * @brief Route an inbound request or notification to its handler
   *
   * @param message The raw JSON-RPC message
   * @return The response for a request with a handler; std::nullopt for
   * notifications and for messages nobody handles
   */
  std::optional<Response> dispatchIncoming(const nlohmann::json &message);

  /**
   * @brief Close one connection and abandon its pending requests
   */
  void disconnect(const std::string &server_name);

  /**
   * @brief Close every connection; safe to call repeatedly
   */
  void shutdownAll();

  std::map<std::string, ConnectionInfo> connectionStatus() const;

  bool isConnected(const std::string &server_name) const;

  /**
   * @brief Number of requests still waiting for a response
   */
  std::size_t pendingCount() const;

  /**
   * @brief Allocate a new correlation id
   */
  std::string generateMessageId();

private:
  struct PendingMessage {
    std::string method;
    std::chrono::steady_clock::time_point created;
    std::promise<Response> promise;
  };

  struct Connection {
    ConnectionInfo info;
    std::shared_ptr<transport::Transport> transport;
    std::unordered_map<std::string, PendingMessage> pending;
  };

  void handleMessage(const std::weak_ptr<Connection> &weak,
                     const types::JSONRPCMessage &message);
  void handleTransportError(const std::weak_ptr<Connection> &weak,
                            const std::error_code &error);
  void handleTransportClosed(const std::weak_ptr<Connection> &weak);
  void resolvePending(const std::weak_ptr<Connection> &weak,
                      const types::RequestId &id, Response response);
  static void abandonPending(Connection &connection, const std::string &reason);

  std::shared_ptr<transport::TransportFactory> factory_;
  std::chrono::milliseconds default_timeout_;

  std::map<std::string, std::shared_ptr<Connection>> connections_;
  mutable std::mutex connections_mutex_;

  std::unordered_map<std::string, MethodHandler> handlers_;
  std::mutex handlers_mutex_;

  std::atomic<uint64_t> message_counter_;
  std::mt19937 rng_;
  std::mutex rng_mutex_;
};

} // namespace toolmesh

#endif // TOOLMESH_SESSION_MESSAGE_CORRELATOR_HPP_
