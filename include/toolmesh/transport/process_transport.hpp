#ifndef TOOLMESH_TRANSPORT_PROCESS_TRANSPORT_HPP_
#define TOOLMESH_TRANSPORT_PROCESS_TRANSPORT_HPP_

#include "toolmesh/transport/connection_params.hpp"
#include "toolmesh/transport/transport.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <sys/types.h>
#include <thread>

namespace toolmesh {
namespace transport {

/**
 * @brief Transport that spawns a tool server and talks to it over pipes
 *
 * The child's stdin receives one serialized JSON-RPC message per line and
 * each line the child writes to stdout is parsed as one message. The child's
 * stderr is inherited so that server logs stay visible.
 */
class ProcessTransport : public Transport {
public:
  explicit ProcessTransport(ProcessParams params);

  ~ProcessTransport() override;

  ProcessTransport(const ProcessTransport &) = delete;
  ProcessTransport &operator=(const ProcessTransport &) = delete;

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
   * @brief Spawn the child and start the IO threads
   *
   * @throws TransportException if the pipes cannot be created or the command
   * cannot be executed
   */
  void connect() override;

  /**
   * @brief Stop the IO threads and terminate the child
   *
   * The child first sees EOF on stdin; it is sent SIGTERM and finally SIGKILL
   * if it has not exited within the grace period.
   */
  void disconnect() override;

  bool isConnected() const override;

  /**
   * @brief Process id of the running child, or -1
   */
  pid_t pid() const;

private:
  struct SendOperation {
    types::JSONRPCMessage message;
    std::function<void(const std::error_code &)> callback;
  };

  void spawn();
  void readLoop();
  void writeLoop();
  void processLine(const std::string &line);
  bool writeAll(const std::string &data);
  void reapChild();
  void failPendingSends();
  void reportError(const std::error_code &error);
  void notifyClosed();

  ProcessParams params_;

  pid_t pid_;
  int stdin_fd_;
  int stdout_fd_;

  // Thread management
  std::thread read_thread_;
  std::thread write_thread_;
  std::atomic<bool> running_;
  std::atomic<bool> connected_;
  std::mutex lifecycle_mutex_;

  // Callbacks
  std::function<void(types::JSONRPCMessage)> message_callback_;
  std::function<void(std::error_code)> error_callback_;
  std::function<void()> close_callback_;
  std::mutex callback_mutex_;

  // Send queue
  std::queue<SendOperation> send_queue_;
  std::mutex send_queue_mutex_;
  std::condition_variable send_queue_cv_;
};

} // namespace transport
} // namespace toolmesh

#endif // TOOLMESH_TRANSPORT_PROCESS_TRANSPORT_HPP_
