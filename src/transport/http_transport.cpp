#include "toolmesh/transport/http_transport.hpp"
#include "toolmesh/utils/error.hpp"
#include "toolmesh/utils/json_utils.hpp"
#include "toolmesh/utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <curl/curl.h>
#include <future>
#include <sstream>

namespace toolmesh {
namespace transport {

namespace {

constexpr const char *kSessionHeader = "mcp-session-id";

struct ResponseHeaders {
  std::string content_type;
  std::string session_id;
};

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

std::string trim(const std::string &value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

} // namespace

size_t HttpTransport::writeCallback(char *ptr, size_t size, size_t nmemb,
                                    void *userdata) {
  auto *response = static_cast<std::string *>(userdata);
  response->append(ptr, size * nmemb);
  return size * nmemb;
}

size_t HttpTransport::headerCallback(char *buffer, size_t size, size_t nitems,
                                     void *userdata) {
  auto *headers = static_cast<ResponseHeaders *>(userdata);
  std::string line(buffer, size * nitems);
  auto colon = line.find(':');
  if (colon != std::string::npos) {
    std::string name = toLower(trim(line.substr(0, colon)));
    std::string value = trim(line.substr(colon + 1));
    if (name == "content-type") {
      headers->content_type = value;
    } else if (name == kSessionHeader) {
      headers->session_id = value;
    }
  }
  return size * nitems;
}

HttpTransport::HttpTransport(NetworkParams params)
    : params_(std::move(params)), connected_(false), stopping_(false) {
  static std::once_flag curl_init_flag;
  std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

HttpTransport::~HttpTransport() { disconnect(); }

void HttpTransport::send(
    const types::JSONRPCMessage &message,
    std::function<void(const std::error_code &)> callback) {
  if (!isConnected()) {
    if (callback) {
      callback(make_error_code(TransportError::Disconnected));
    }
    return;
  }

  std::string body;
  try {
    body = json_utils::serializeMessage(message);
  } catch (const std::exception &e) {
    TOOLMESH_LOG_ERROR("Failed to serialize message: " +
                       std::string(e.what()));
    if (callback) {
      callback(make_error_code(TransportError::WriteError));
    }
    return;
  }

  {
    std::lock_guard<std::mutex> lock(send_queue_mutex_);
    send_queue_.push_back({std::move(body), std::move(callback)});
  }

  send_queue_cv_.notify_one();
}

std::error_code HttpTransport::send(const types::JSONRPCMessage &message,
                                    std::chrono::milliseconds timeout) {
  if (!isConnected()) {
    return make_error_code(TransportError::Disconnected);
  }

  auto promise = std::make_shared<std::promise<std::error_code>>();
  auto future = promise->get_future();

  send(message,
       [promise](const std::error_code &ec) { promise->set_value(ec); });

  if (future.wait_for(timeout) == std::future_status::timeout) {
    return make_error_code(TransportError::Timeout);
  }

  return future.get();
}

void HttpTransport::setMessageCallback(
    std::function<void(types::JSONRPCMessage)> callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  message_callback_ = std::move(callback);
}

void HttpTransport::setErrorCallback(
    std::function<void(std::error_code)> callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  error_callback_ = std::move(callback);
}

void HttpTransport::setCloseCallback(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  close_callback_ = std::move(callback);
}

void HttpTransport::connect() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (connected_) {
    return;
  }

  stopping_ = false;
  connected_ = true;
  send_thread_ = std::thread(&HttpTransport::sendThread, this);

  TOOLMESH_LOG_INFO("HttpTransport ready for " + params_.url);
}

void HttpTransport::disconnect() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!connected_) {
    return;
  }

  stopping_ = true;
  connected_ = false;

  {
    std::lock_guard<std::mutex> queue_lock(send_queue_mutex_);
    send_queue_cv_.notify_all();
  }

  if (send_thread_.joinable()) {
    send_thread_.join();
  }

  // Whatever the thread did not get to is abandoned
  std::deque<PendingSend> abandoned;
  {
    std::lock_guard<std::mutex> queue_lock(send_queue_mutex_);
    std::swap(abandoned, send_queue_);
  }
  for (auto &pending : abandoned) {
    if (pending.callback) {
      pending.callback(make_error_code(TransportError::Disconnected));
    }
  }

  std::function<void()> close_callback;
  {
    std::lock_guard<std::mutex> callback_lock(callback_mutex_);
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

  TOOLMESH_LOG_INFO("HttpTransport closed for " + params_.url);
}

bool HttpTransport::isConnected() const { return connected_; }

void HttpTransport::sendThread() {
  TOOLMESH_LOG_DEBUG("HTTP send thread started");

  while (!stopping_) {
    PendingSend pending;

    {
      std::unique_lock<std::mutex> lock(send_queue_mutex_);

      send_queue_cv_.wait(
          lock, [this]() { return stopping_ || !send_queue_.empty(); });

      if (stopping_) {
        break;
      }

      pending = std::move(send_queue_.front());
      send_queue_.pop_front();
    }

    auto ec = sendHttpRequest(pending.body);
    if (pending.callback) {
      pending.callback(ec);
    }
    if (ec) {
      reportError(ec);
    }
  }

  TOOLMESH_LOG_DEBUG("HTTP send thread stopped");
}

std::error_code HttpTransport::sendHttpRequest(const std::string &body) {
  CURL *curl = curl_easy_init();
  if (!curl) {
    return make_error_code(TransportError::HttpError);
  }

  std::string response_data;
  ResponseHeaders response_headers;

  struct curl_slist *headers = nullptr;
  headers = curl_slist_append(headers, "Content-Type: application/json");
  headers = curl_slist_append(
      headers, "Accept: application/json, text/event-stream");
  {
    std::lock_guard<std::mutex> lock(session_id_mutex_);
    if (!session_id_.empty()) {
      headers = curl_slist_append(
          headers, ("Mcp-Session-Id: " + session_id_).c_str());
    }
  }
  for (const auto &[name, value] : params_.headers) {
    headers = curl_slist_append(headers, (name + ": " + value).c_str());
  }

  curl_easy_setopt(curl, CURLOPT_URL, params_.url.c_str());
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(params_.timeout.count()));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                   static_cast<long>(params_.timeout.count()));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_data);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response_headers);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl);

  long http_code = 0;
  if (res == CURLE_OK) {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  }

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    TOOLMESH_LOG_ERROR("HTTP request to " + params_.url +
                       " failed: " + curl_easy_strerror(res));
    return make_error_code(TransportError::HttpError);
  }

  if (http_code < 200 || http_code >= 300) {
    TOOLMESH_LOG_ERROR("HTTP request to " + params_.url +
                       " returned status " + std::to_string(http_code) +
                       ": " + response_data);
    return make_error_code(TransportError::HttpError);
  }

  if (!response_headers.session_id.empty()) {
    std::lock_guard<std::mutex> lock(session_id_mutex_);
    session_id_ = response_headers.session_id;
  }

  TOOLMESH_LOG_DEBUG("HTTP request successful, response length: " +
                     std::to_string(response_data.size()));

  std::vector<nlohmann::json> payloads;
  try {
    payloads = extractPayloads(response_data, response_headers.content_type);
  } catch (const ProtocolException &e) {
    TOOLMESH_LOG_ERROR("Unreadable response body from " + params_.url + ": " +
                       e.what());
    return make_error_code(TransportError::ReadError);
  }

  for (const auto &payload : payloads) {
    deliver(payload);
  }

  return {};
}

std::vector<nlohmann::json>
HttpTransport::extractPayloads(const std::string &body,
                               const std::string &content_type) {
  std::vector<nlohmann::json> payloads;

  auto append = [&payloads](const std::string &text) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) {
      return;
    }
    nlohmann::json parsed = json_utils::parse(trimmed);
    if (parsed.is_array()) {
      for (auto &item : parsed) {
        payloads.push_back(std::move(item));
      }
    } else {
      payloads.push_back(std::move(parsed));
    }
  };

  if (toLower(content_type).find("text/event-stream") == std::string::npos) {
    append(body);
    return payloads;
  }

  // Server-sent events: data lines accumulate until a blank line
  std::istringstream stream(body);
  std::string line;
  std::string data;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      append(data);
      data.clear();
    } else if (line.rfind("data:", 0) == 0) {
      if (!data.empty()) {
        data += "\n";
      }
      data += trim(line.substr(5));
    }
  }
  append(data);

  return payloads;
}

void HttpTransport::deliver(const nlohmann::json &payload) {
  types::JSONRPCMessage message;
  try {
    message = json_utils::toMessage(payload);
  } catch (const ProtocolException &e) {
    TOOLMESH_LOG_WARNING("Ignoring malformed message from " + params_.url +
                         ": " + e.what());
    return;
  }

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

void HttpTransport::reportError(const std::error_code &error) {
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

} // namespace transport
} // namespace toolmesh
