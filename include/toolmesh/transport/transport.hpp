#ifndef TOOLMESH_TRANSPORT_TRANSPORT_HPP_
#define TOOLMESH_TRANSPORT_TRANSPORT_HPP_

#include "toolmesh/types.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <system_error>

namespace toolmesh {
namespace transport {

/**
 * @brief Abstract base class for the byte channel to one tool server
 *
 * A transport moves whole JSON-RPC messages to and from a server. It does
 * not correlate requests with responses; that is the MessageCorrelator's job.
 */
class Transport {
public:
  virtual ~Transport() = default;

  /**
   * @brief Asynchronously send a message
   *
   * @param message The message to send
   * @param callback The callback to invoke when the operation completes
   */
  virtual void send(const types::JSONRPCMessage &message,
                    std::function<void(const std::error_code &)> callback) = 0;

  /**
   * @brief Synchronously send a message with timeout
   *
   * @param message The message to send
   * @param timeout The timeout for the operation
   * @return std::error_code An error code if the operation failed
   */
  virtual std::error_code
  send(const types::JSONRPCMessage &message,
       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) = 0;

  /**
   * @brief Set the callback for received messages
   */
  virtual void
  setMessageCallback(std::function<void(types::JSONRPCMessage)> callback) = 0;

  /**
   * @brief Set the callback for transport errors
   */
  virtual void
  setErrorCallback(std::function<void(std::error_code)> callback) = 0;

  /**
   * @brief Set the callback for connection closure
   */
  virtual void setCloseCallback(std::function<void()> callback) = 0;

  /**
   * @brief Open the channel
   *
   * @throws TransportException if the channel cannot be opened
   */
  virtual void connect() = 0;

  virtual void disconnect() = 0;

  virtual bool isConnected() const = 0;
};

/**
 * @brief Error conditions shared by the bundled transports
 */
enum class TransportError {
  Timeout = 1,
  Disconnected,
  WriteError,
  ReadError,
  SpawnError,
  HttpError
};

/**
 * @brief Error category for TransportError values
 */
const std::error_category &transport_category();

std::error_code make_error_code(TransportError e);

} // namespace transport
} // namespace toolmesh

namespace std {
template <>
struct is_error_code_enum<toolmesh::transport::TransportError> : true_type {};
} // namespace std

#endif // TOOLMESH_TRANSPORT_TRANSPORT_HPP_
