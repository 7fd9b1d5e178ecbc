#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

#include "toolmesh/transport/connection_params.hpp"
#include "toolmesh/transport/http_transport.hpp"
#include "toolmesh/transport/process_transport.hpp"
#include "toolmesh/transport/transport_factory.hpp"
#include "toolmesh/utils/error.hpp"

using namespace toolmesh;
using namespace toolmesh::transport;
using json = nlohmann::json;

namespace {

// Collects delivered messages and lets a test wait for them
class MessageCollector {
public:
  std::function<void(types::JSONRPCMessage)> callback() {
    return [this](types::JSONRPCMessage message) {
      std::lock_guard<std::mutex> lock(mutex_);
      messages_.push_back(std::move(message));
      cv_.notify_all();
    };
  }

  bool waitFor(std::size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout,
                        [&] { return messages_.size() >= count; });
  }

  std::vector<types::JSONRPCMessage> messages() {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<types::JSONRPCMessage> messages_;
};

types::JSONRPCRequest listToolsRequest(const std::string &id) {
  types::JSONRPCRequest request;
  request.id = id;
  request.method = "tools/list";
  return request;
}

} // namespace

TEST(ConnectionParamsTest, KindAndDescription) {
  ProcessParams process;
  process.command = "python";
  process.args = {"server.py"};
  NetworkParams network;
  network.url = "http://localhost:8001/mcp";

  EXPECT_EQ(kindOf(process), TransportKind::Process);
  EXPECT_EQ(kindOf(network), TransportKind::Network);
  EXPECT_EQ(toString(TransportKind::Process), "process");
  EXPECT_EQ(toString(TransportKind::Network), "network");
  EXPECT_NE(describe(process).find("python"), std::string::npos);
  EXPECT_NE(describe(network).find("http://localhost:8001/mcp"),
            std::string::npos);
}

TEST(TransportFactoryTest, CreatesMatchingTransport) {
  DefaultTransportFactory factory;
  ProcessParams process;
  process.command = "cat";
  NetworkParams network;
  network.url = "http://127.0.0.1:1/mcp";

  auto process_transport = factory.create(process);
  auto network_transport = factory.create(network);

  EXPECT_NE(dynamic_cast<ProcessTransport *>(process_transport.get()), nullptr);
  EXPECT_NE(dynamic_cast<HttpTransport *>(network_transport.get()), nullptr);
  EXPECT_FALSE(process_transport->isConnected());
  EXPECT_FALSE(network_transport->isConnected());
}

TEST(HttpPayloadTest, PlainJsonBody) {
  auto payloads = HttpTransport::extractPayloads(
      R"({"jsonrpc": "2.0", "id": "1_00000001", "result": {}})",
      "application/json");

  ASSERT_EQ(payloads.size(), 1u);
  EXPECT_EQ(payloads[0]["id"], "1_00000001");
}

TEST(HttpPayloadTest, BatchBodyIsSplit) {
  auto payloads = HttpTransport::extractPayloads(
      R"([{"jsonrpc": "2.0", "method": "notifications/message"},
          {"jsonrpc": "2.0", "id": 2, "result": {}}])",
      "application/json; charset=utf-8");

  ASSERT_EQ(payloads.size(), 2u);
  EXPECT_EQ(payloads[0]["method"], "notifications/message");
  EXPECT_EQ(payloads[1]["id"], 2);
}

TEST(HttpPayloadTest, EmptyBodyHasNoPayloads) {
  EXPECT_TRUE(HttpTransport::extractPayloads("", "application/json").empty());
  EXPECT_TRUE(HttpTransport::extractPayloads("  \r\n", "").empty());
}

TEST(HttpPayloadTest, EventStreamDataLines) {
  std::string body = "event: message\r\n"
                     "data: {\"jsonrpc\": \"2.0\", \"method\": \"ping\", "
                     "\"id\": 5}\r\n"
                     "\r\n"
                     ": keep-alive\n"
                     "\n"
                     "event: message\n"
                     "data: {\"jsonrpc\": \"2.0\", \"id\": \"7_0000abcd\",\n"
                     "data:  \"result\": {\"tools\": []}}\n";

  auto payloads = HttpTransport::extractPayloads(body, "Text/Event-Stream");

  ASSERT_EQ(payloads.size(), 2u);
  EXPECT_EQ(payloads[0]["method"], "ping");
  EXPECT_EQ(payloads[1]["id"], "7_0000abcd");
  EXPECT_TRUE(payloads[1]["result"]["tools"].is_array());
}

TEST(HttpPayloadTest, UnparsableBodyThrows) {
  EXPECT_THROW(HttpTransport::extractPayloads("<html>", "text/html"),
               ProtocolException);
}

TEST(HttpTransportTest, SendBeforeConnectFails) {
  NetworkParams params;
  params.url = "http://127.0.0.1:1/mcp";
  HttpTransport transport(params);

  auto ec = transport.send(listToolsRequest("1_00000000"),
                           std::chrono::milliseconds(100));

  EXPECT_EQ(ec, make_error_code(TransportError::Disconnected));
}

TEST(HttpTransportTest, UnreachableServerReportsHttpError) {
  NetworkParams params;
  params.url = "http://127.0.0.1:1/mcp";
  params.timeout = std::chrono::seconds(2);
  HttpTransport transport(params);

  std::error_code reported;
  transport.setErrorCallback([&reported](std::error_code ec) { reported = ec; });
  transport.connect();
  ASSERT_TRUE(transport.isConnected());

  auto ec = transport.send(listToolsRequest("1_00000000"),
                           std::chrono::seconds(5));

  EXPECT_EQ(ec, make_error_code(TransportError::HttpError));
  transport.disconnect();
  EXPECT_FALSE(transport.isConnected());
}

TEST(ProcessTransportTest, MessagesRoundTripThroughChild) {
  ProcessParams params;
  params.command = "cat";
  ProcessTransport transport(params);

  MessageCollector collector;
  transport.setMessageCallback(collector.callback());
  transport.connect();
  ASSERT_TRUE(transport.isConnected());
  EXPECT_GT(transport.pid(), 0);

  EXPECT_FALSE(transport.send(listToolsRequest("1_deadbeef"),
                              std::chrono::seconds(2)));

  ASSERT_TRUE(collector.waitFor(1, std::chrono::seconds(5)));
  auto messages = collector.messages();
  ASSERT_TRUE(std::holds_alternative<types::JSONRPCRequest>(messages[0]));
  EXPECT_EQ(types::idToString(std::get<types::JSONRPCRequest>(messages[0]).id),
            "1_deadbeef");

  transport.disconnect();
  EXPECT_FALSE(transport.isConnected());
  EXPECT_EQ(transport.pid(), -1);
}

TEST(ProcessTransportTest, NonJsonOutputIsSkipped) {
  ProcessParams params;
  params.command = "sh";
  params.args = {"-c", "echo 'server starting'; cat"};
  ProcessTransport transport(params);

  MessageCollector collector;
  transport.setMessageCallback(collector.callback());
  transport.connect();

  transport.send(listToolsRequest("2_00000002"), std::chrono::seconds(2));

  ASSERT_TRUE(collector.waitFor(1, std::chrono::seconds(5)));
  EXPECT_EQ(collector.messages().size(), 1u);
  transport.disconnect();
}

TEST(ProcessTransportTest, EnvironmentIsPassedToChild) {
  ProcessParams params;
  params.command = "sh";
  params.args = {"-c", "printf '{\"jsonrpc\":\"2.0\",\"method\":\"%s\"}\\n' "
                       "\"$TOOLMESH_TEST_METHOD\"; cat"};
  params.env = {{"TOOLMESH_TEST_METHOD", "notifications/hello"}};
  ProcessTransport transport(params);

  MessageCollector collector;
  transport.setMessageCallback(collector.callback());
  transport.connect();

  ASSERT_TRUE(collector.waitFor(1, std::chrono::seconds(5)));
  auto messages = collector.messages();
  ASSERT_TRUE(std::holds_alternative<types::JSONRPCNotification>(messages[0]));
  EXPECT_EQ(std::get<types::JSONRPCNotification>(messages[0]).method,
            "notifications/hello");
  transport.disconnect();
}

TEST(ProcessTransportTest, MissingExecutableThrows) {
  ProcessParams params;
  params.command = "/nonexistent/toolmesh-test-server";
  ProcessTransport transport(params);

  EXPECT_THROW(transport.connect(), TransportException);
  EXPECT_FALSE(transport.isConnected());
}

TEST(ProcessTransportTest, ChildExitClosesTransport) {
  ProcessParams params;
  params.command = "true";
  ProcessTransport transport(params);

  std::mutex mutex;
  std::condition_variable cv;
  bool closed = false;
  transport.setCloseCallback([&] {
    std::lock_guard<std::mutex> lock(mutex);
    closed = true;
    cv.notify_all();
  });

  transport.connect();

  std::unique_lock<std::mutex> lock(mutex);
  EXPECT_TRUE(cv.wait_for(lock, std::chrono::seconds(5), [&] { return closed; }));
  lock.unlock();

  EXPECT_FALSE(transport.isConnected());
  EXPECT_EQ(transport.send(listToolsRequest("3_00000003"),
                           std::chrono::milliseconds(100)),
            make_error_code(TransportError::Disconnected));
  transport.disconnect();
}

TEST(ProcessTransportTest, DisconnectIsIdempotent) {
  ProcessParams params;
  params.command = "cat";
  ProcessTransport transport(params);
  transport.connect();

  transport.disconnect();
  EXPECT_NO_THROW(transport.disconnect());
}

TEST(ProcessTransportTest, SiblingProcessDoesNotKeepStdinOpen) {
  ProcessParams params;
  params.command = "cat";
  ProcessTransport first(params);
  ProcessTransport second(params);
  first.connect();
  second.connect();

  // cat exits on EOF; the SIGTERM fallback only starts after 500 ms
  auto started = std::chrono::steady_clock::now();
  first.disconnect();
  auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_LT(elapsed, std::chrono::milliseconds(400));
  EXPECT_TRUE(second.isConnected());
  second.disconnect();
}

TEST(ProcessTransportTest, DisconnectRightAfterConnectReturns) {
  ProcessParams params;
  params.command = "cat";

  for (int i = 0; i < 20; ++i) {
    ProcessTransport transport(params);
    transport.connect();
    transport.disconnect();
    EXPECT_FALSE(transport.isConnected());
  }
}
