#ifndef TOOLMESH_TRANSPORT_HTTP_TRANSPORT_HPP_
#define TOOLMESH_TRANSPORT_HTTP_TRANSPORT_HPP_

#include "toolmesh/transport/connection_params.hpp"
#include "toolmesh/transport/transport.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace toolmesh {
namespace transport {

/**
 * @brief Transport that POSTs each JSON-RPC message to a tool server URL
 *
 * Every outbound message is one HTTP POST. The response body is either a
 * JSON-RPC message (or a batch of them) or a text/event-stream whose `data:`
 * lines carry messages; each one is handed to the message callback.
 * A session id returned by the server in `Mcp-Session-Id` is echoed on
 * subsequent requests.
 */
class HttpTransport : public Transport {
public:
  explicit HttpTransport(NetworkParams params);

  ~HttpTransport() override;

  HttpTransport(const HttpTransport &) = delete;
  HttpTransport &operator=(const HttpTransport &) = delete;

  // Transport interface implementation
  void send(const types::JSONRPCMessage &message,
            std::function<void(const std::error_code &)> callback) override;

  std::error_code send(const types::JSONRPCMessage &message,
                       std::chrono::milliseconds timeout) override;

  void setMessageCallback(
      std::function<void(types::JSONRPCMessage)> callback) override;

  void setErrorCallback(std::function<void(std::error_code)> callback) override;

  void setCloseCallback(std::function<void()> callback) override;

  /**
   * @brief Start the send thread
   *
   * HTTP has no persistent channel, so reachability is only known once the
   * first request completes.
   */
  void connect() override;
  void disconnect() override;
  bool isConnected() const override;

  /**
   * @brief Extract the JSON payloads from a response body
   *
   * @param body The raw response body
   * @param content_type The response Content-Type header value
   * @return The messages found in the body, in order
   */
  static std::vector<nlohmann::json>
  extractPayloads(const std::string &body, const std::string &content_type);

private:
  struct PendingSend {
    std::string body;
    std::function<void(const std::error_code &)> callback;
  };

  void sendThread();
  std::error_code sendHttpRequest(const std::string &body);
  void deliver(const nlohmann::json &payload);
  void reportError(const std::error_code &error);

  static size_t writeCallback(char *ptr, size_t size, size_t nmemb,
                              void *userdata);
  static size_t headerCallback(char *buffer, size_t size, size_t nitems,
                               void *userdata);

  NetworkParams params_;

  std::atomic<bool> connected_;
  std::atomic<bool> stopping_;
  std::thread send_thread_;
  std::mutex lifecycle_mutex_;

  std::string session_id_;
  std::mutex session_id_mutex_;

  // Callbacks
  std::function<void(types::JSONRPCMessage)> message_callback_;
  std::function<void(std::error_code)> error_callback_;
  std::function<void()> close_callback_;
  std::mutex callback_mutex_;

  // Send queue
  std::deque<PendingSend> send_queue_;
  std::mutex send_queue_mutex_;
  std::condition_variable send_queue_cv_;
};

} // namespace transport
} // namespace toolmesh

#endif // TOOLMESH_TRANSPORT_HTTP_TRANSPORT_HPP_
