#include "toolmesh/transport/process_transport.hpp"
#include "toolmesh/utils/error.hpp"
#include "toolmesh/utils/json_utils.hpp"
#include "toolmesh/utils/logging.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <future>
#include <map>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace toolmesh {
namespace transport {

namespace {

constexpr int kPollIntervalMs = 100;
constexpr auto kExitGracePeriod = std::chrono::milliseconds(500);
constexpr auto kTerminateGracePeriod = std::chrono::milliseconds(200);

void closeFd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Child side of fork: installs fd as target without close-on-exec.
void redirectFd(int fd, int target) {
  if (fd == target) {
    ::fcntl(fd, F_SETFD, ::fcntl(fd, F_GETFD) & ~FD_CLOEXEC);
    return;
  }
  ::dup2(fd, target);
  ::close(fd);
}

// Polls for the child's exit until the deadline; true once it is reaped.
bool waitForExit(pid_t pid, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    int status = 0;
    pid_t result = ::waitpid(pid, &status, WNOHANG);
    if (result == pid || (result < 0 && errno == ECHILD)) {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

std::vector<std::string>
buildEnvironment(const std::map<std::string, std::string> &extra) {
  std::map<std::string, std::string> merged;
  for (char **entry = environ; entry && *entry; ++entry) {
    std::string item(*entry);
    auto eq = item.find('=');
    if (eq != std::string::npos) {
      merged[item.substr(0, eq)] = item.substr(eq + 1);
    }
  }
  for (const auto &[key, value] : extra) {
    merged[key] = value;
  }

  std::vector<std::string> result;
  result.reserve(merged.size());
  for (const auto &[key, value] : merged) {
    result.push_back(key + "=" + value);
  }
  return result;
}

} // namespace

ProcessTransport::ProcessTransport(ProcessParams params)
    : params_(std::move(params)), pid_(-1), stdin_fd_(-1), stdout_fd_(-1),
      running_(false), connected_(false) {}

ProcessTransport::~ProcessTransport() { disconnect(); }

void ProcessTransport::send(
    const types::JSONRPCMessage &message,
    std::function<void(const std::error_code &)> callback) {
  if (!connected_) {
    if (callback) {
      callback(make_error_code(TransportError::Disconnected));
    }
    return;
  }

  {
    std::lock_guard<std::mutex> lock(send_queue_mutex_);
    send_queue_.push({message, std::move(callback)});
  }

  send_queue_cv_.notify_one();
}

std::error_code ProcessTransport::send(const types::JSONRPCMessage &message,
                                       std::chrono::milliseconds timeout) {
  if (!connected_) {
    return make_error_code(TransportError::Disconnected);
  }

  // Shared so that a late completion after a timeout stays valid
  auto promise = std::make_shared<std::promise<std::error_code>>();
  auto future = promise->get_future();

  send(message,
       [promise](const std::error_code &ec) { promise->set_value(ec); });

  if (future.wait_for(timeout) == std::future_status::timeout) {
    return make_error_code(TransportError::Timeout);
  }

  return future.get();
}

void ProcessTransport::setMessageCallback(
    std::function<void(types::JSONRPCMessage)> callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  message_callback_ = std::move(callback);
}

void ProcessTransport::setErrorCallback(
    std::function<void(std::error_code)> callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  error_callback_ = std::move(callback);
}

void ProcessTransport::setCloseCallback(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  close_callback_ = std::move(callback);
}

void ProcessTransport::connect() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_) {
    return;
  }

  // A dead child must not kill us when we write to its stdin
  static std::once_flag sigpipe_flag;
  std::call_once(sigpipe_flag, []() { std::signal(SIGPIPE, SIG_IGN); });

  spawn();

  running_ = true;
  connected_ = true;

  read_thread_ = std::thread(&ProcessTransport::readLoop, this);
  write_thread_ = std::thread(&ProcessTransport::writeLoop, this);

  TOOLMESH_LOG_INFO("ProcessTransport started '" + params_.command +
                    "' (pid " + std::to_string(pid_) + ")");
}

void ProcessTransport::spawn() {
  int in_pipe[2];
  int out_pipe[2];
  int status_pipe[2];

  // Close-on-exec: a server spawned concurrently must not inherit these ends
  if (::pipe2(in_pipe, O_CLOEXEC) != 0) {
    throw TransportException(std::error_code(errno, std::system_category()));
  }
  if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
    int err = errno;
    ::close(in_pipe[0]);
    ::close(in_pipe[1]);
    throw TransportException(std::error_code(err, std::system_category()));
  }
  if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
    int err = errno;
    ::close(in_pipe[0]);
    ::close(in_pipe[1]);
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    throw TransportException(std::error_code(err, std::system_category()));
  }

  // Everything the child needs is prepared before fork
  std::vector<std::string> env_storage = buildEnvironment(params_.env);
  std::vector<char *> envp;
  for (auto &entry : env_storage) {
    envp.push_back(entry.data());
  }
  envp.push_back(nullptr);

  std::vector<std::string> arg_storage;
  arg_storage.push_back(params_.command);
  arg_storage.insert(arg_storage.end(), params_.args.begin(),
                     params_.args.end());
  std::vector<char *> argv;
  for (auto &arg : arg_storage) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    int err = errno;
    ::close(in_pipe[0]);
    ::close(in_pipe[1]);
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    ::close(status_pipe[0]);
    ::close(status_pipe[1]);
    throw TransportException(std::error_code(err, std::system_category()));
  }

  if (pid == 0) {
    ::close(in_pipe[1]);
    ::close(out_pipe[0]);
    ::close(status_pipe[0]);
    redirectFd(in_pipe[0], STDIN_FILENO);
    redirectFd(out_pipe[1], STDOUT_FILENO);
    ::execvpe(argv[0], argv.data(), envp.data());
    int err = errno;
    ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  ::close(in_pipe[0]);
  ::close(out_pipe[1]);
  ::close(status_pipe[1]);

  // The status pipe closes on a successful exec; otherwise it carries errno
  int exec_errno = 0;
  ssize_t n;
  do {
    n = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  ::close(status_pipe[0]);

  if (n > 0) {
    ::waitpid(pid, nullptr, 0);
    ::close(in_pipe[1]);
    ::close(out_pipe[0]);
    throw TransportException(
        types::ErrorCode::TransportError,
        "Failed to start '" + params_.command +
            "': " + std::strerror(exec_errno),
        {{"command", params_.command}, {"errno", exec_errno}});
  }

  pid_ = pid;
  stdin_fd_ = in_pipe[1];
  stdout_fd_ = out_pipe[0];
}

void ProcessTransport::disconnect() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_) {
    return;
  }

  bool was_connected = connected_.exchange(false);
  {
    std::lock_guard<std::mutex> queue_lock(send_queue_mutex_);
    running_ = false;
  }
  send_queue_cv_.notify_all();
  if (write_thread_.joinable()) {
    write_thread_.join();
  }

  // EOF on stdin is the polite request for the child to exit
  closeFd(stdin_fd_);

  if (read_thread_.joinable()) {
    read_thread_.join();
  }

  reapChild();
  closeFd(stdout_fd_);
  failPendingSends();

  if (was_connected) {
    notifyClosed();
  }

  TOOLMESH_LOG_INFO("ProcessTransport stopped '" + params_.command + "'");
}

bool ProcessTransport::isConnected() const { return connected_; }

pid_t ProcessTransport::pid() const { return pid_; }

void ProcessTransport::reapChild() {
  if (pid_ <= 0) {
    return;
  }

  if (!waitForExit(pid_, kExitGracePeriod)) {
    TOOLMESH_LOG_DEBUG("Sending SIGTERM to pid " + std::to_string(pid_));
    ::kill(pid_, SIGTERM);
    if (!waitForExit(pid_, kTerminateGracePeriod)) {
      TOOLMESH_LOG_WARNING("Killing unresponsive server process pid " +
                           std::to_string(pid_));
      ::kill(pid_, SIGKILL);
      ::waitpid(pid_, nullptr, 0);
    }
  }

  pid_ = -1;
}

void ProcessTransport::failPendingSends() {
  std::queue<SendOperation> pending;
  {
    std::lock_guard<std::mutex> lock(send_queue_mutex_);
    std::swap(pending, send_queue_);
  }

  while (!pending.empty()) {
    auto &op = pending.front();
    if (op.callback) {
      op.callback(make_error_code(TransportError::Disconnected));
    }
    pending.pop();
  }
}

void ProcessTransport::readLoop() {
  std::string buffer;
  char chunk[4096];

  while (running_) {
    pollfd pfd{stdout_fd_, POLLIN, 0};
    int rc = ::poll(&pfd, 1, kPollIntervalMs);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      TOOLMESH_LOG_ERROR("poll failed: " + std::string(std::strerror(errno)));
      reportError(make_error_code(TransportError::ReadError));
      break;
    }
    if (rc == 0) {
      continue;
    }

    ssize_t n = ::read(stdout_fd_, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      reportError(make_error_code(TransportError::ReadError));
      break;
    }
    if (n == 0) {
      TOOLMESH_LOG_DEBUG("Server process closed its stdout");
      break;
    }

    buffer.append(chunk, static_cast<std::size_t>(n));

    std::size_t newline;
    while ((newline = buffer.find('\n')) != std::string::npos) {
      std::string line = buffer.substr(0, newline);
      buffer.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (line.empty()) {
        continue;
      }

      try {
        processLine(line);
      } catch (const ProtocolException &e) {
        // Servers sometimes print banners on stdout; skip what isn't JSON-RPC
        TOOLMESH_LOG_WARNING("Ignoring non JSON-RPC output from '" +
                             params_.command + "': " + e.what());
      }
    }
  }

  // Unexpected EOF or read failure; disconnect() does the cleanup
  if (connected_.exchange(false)) {
    TOOLMESH_LOG_WARNING("Server process '" + params_.command +
                         "' went away");
    notifyClosed();
  }
}

void ProcessTransport::writeLoop() {
  while (running_) {
    SendOperation op;
    {
      std::unique_lock<std::mutex> lock(send_queue_mutex_);

      send_queue_cv_.wait(
          lock, [this] { return !running_ || !send_queue_.empty(); });

      if (!running_) {
        break;
      }

      op = std::move(send_queue_.front());
      send_queue_.pop();
    }

    std::string line;
    try {
      line = json_utils::serializeMessage(op.message) + "\n";
    } catch (const std::exception &e) {
      TOOLMESH_LOG_ERROR("Error serializing message: " + std::string(e.what()));
      if (op.callback) {
        op.callback(make_error_code(TransportError::WriteError));
      }
      continue;
    }

    TOOLMESH_LOG_TRACE("Sending: " + line);

    if (writeAll(line)) {
      if (op.callback) {
        op.callback({});
      }
    } else {
      TOOLMESH_LOG_ERROR("Error writing to server process: " +
                         std::string(std::strerror(errno)));
      if (op.callback) {
        op.callback(make_error_code(TransportError::WriteError));
      }
      reportError(make_error_code(TransportError::WriteError));
    }
  }
}

bool ProcessTransport::writeAll(const std::string &data) {
  std::size_t written = 0;
  while (written < data.size()) {
    ssize_t n =
        ::write(stdin_fd_, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  return true;
}

void ProcessTransport::processLine(const std::string &line) {
  TOOLMESH_LOG_TRACE("Received: " + line);

  types::JSONRPCMessage message = json_utils::parseMessage(line);

  std::function<void(types::JSONRPCMessage)> message_callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    message_callback = message_callback_;
  }

  if (message_callback) {
    try {
      message_callback(std::move(message));
    } catch (const std::exception &e) {
      TOOLMESH_LOG_ERROR("Exception in message callback: " +
                         std::string(e.what()));
    }
  }
}

void ProcessTransport::reportError(const std::error_code &error) {
  std::function<void(std::error_code)> error_callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    error_callback = error_callback_;
  }

  if (error_callback) {
    try {
      error_callback(error);
    } catch (const std::exception &e) {
      TOOLMESH_LOG_ERROR("Exception in error callback: " +
                         std::string(e.what()));
    }
  }
}

void ProcessTransport::notifyClosed() {
  std::function<void()> close_callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    close_callback = close_callback_;
  }

  if (close_callback) {
    try {
      close_callback();
    } catch (const std::exception &e) {
      TOOLMESH_LOG_ERROR("Exception in close callback: " +
                         std::string(e.what()));
    }
  }
}

} // namespace transport
} // namespace toolmesh
