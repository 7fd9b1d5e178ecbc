#include "toolmesh/utils/error.hpp"
#include "toolmesh/utils/json_utils.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace toolmesh;
using namespace toolmesh::json_utils;
using namespace toolmesh::types;
using json = nlohmann::json;

class JsonUtilsTest : public ::testing::Test {};

TEST_F(JsonUtilsTest, ParseValidJson) {
  json parsed = parse(R"({"key": "value", "number": 42})");

  EXPECT_EQ(parsed["key"], "value");
  EXPECT_EQ(parsed["number"], 42);
}

TEST_F(JsonUtilsTest, ParseInvalidJson) {
  EXPECT_THROW(
      {
        try {
          parse(R"({"key": "value", "number": 42)");
        } catch (const ProtocolException &e) {
          EXPECT_EQ(e.error().code, static_cast<int>(ErrorCode::ParseError));
          throw;
        }
      },
      ProtocolException);
}

TEST_F(JsonUtilsTest, ValidateAgainstSchema) {
  json schema = json::parse(R"({
    "type": "object",
    "required": ["name", "age"],
    "properties": {
      "name": {"type": "string"},
      "age": {"type": "integer", "minimum": 0}
    }
  })");

  std::string error_msg;
  EXPECT_TRUE(validate(json{{"name", "John"}, {"age", 30}}, schema, &error_msg));
  EXPECT_TRUE(error_msg.empty());

  EXPECT_FALSE(
      validate(json{{"name", "John"}, {"age", -5}}, schema, &error_msg));
  EXPECT_FALSE(error_msg.empty());

  EXPECT_FALSE(validate(json{{"name", "John"}}, schema));
}

TEST_F(JsonUtilsTest, GetMessageType) {
  EXPECT_EQ(getMessageType(json::parse(
                R"({"jsonrpc": "2.0", "id": 1, "method": "ping"})")),
            MessageType::Request);
  EXPECT_EQ(getMessageType(json::parse(
                R"({"jsonrpc": "2.0", "method": "notifications/message"})")),
            MessageType::Notification);
  EXPECT_EQ(getMessageType(
                json::parse(R"({"jsonrpc": "2.0", "id": 1, "result": {}})")),
            MessageType::Response);
  EXPECT_EQ(getMessageType(json::parse(
                R"({"jsonrpc": "2.0", "id": 1,
                    "error": {"code": -32601, "message": "x"}})")),
            MessageType::Error);
}

TEST_F(JsonUtilsTest, GetMessageTypeRejectsNonJsonRpc) {
  EXPECT_THROW(getMessageType(json::parse(R"({"id": 1, "method": "ping"})")),
               ProtocolException);
  EXPECT_THROW(getMessageType(json::parse(R"({"jsonrpc": "1.0", "id": 1})")),
               ProtocolException);
  EXPECT_THROW(getMessageType(json::parse(R"({"jsonrpc": "2.0", "id": 1})")),
               ProtocolException);
  EXPECT_THROW(getMessageType(json::array()), ProtocolException);
}

TEST_F(JsonUtilsTest, ParseMessageProducesTypedMessage) {
  auto message = parseMessage(
      R"({"jsonrpc": "2.0", "id": "5_0badf00d", "result": {"tools": []}})");

  ASSERT_TRUE(std::holds_alternative<JSONRPCResponse>(message));
  const auto &response = std::get<JSONRPCResponse>(message);
  EXPECT_EQ(idToString(response.id), "5_0badf00d");
  EXPECT_TRUE(response.result["tools"].is_array());
}

TEST_F(JsonUtilsTest, ParseMessageRejectsMalformedFields) {
  EXPECT_THROW(parseMessage(R"({"jsonrpc": "2.0", "id": 1, "method": 7})"),
               ProtocolException);
}

TEST_F(JsonUtilsTest, SerializeMessageIsSingleLine) {
  JSONRPCRequest request;
  request.id = "1_00000000";
  request.method = "tools/call";
  request.params = json{{"name", "run_command"},
                        {"arguments", {{"command", "ls\n-la"}}}};

  std::string line = serializeMessage(request);

  EXPECT_EQ(line.find('\n'), std::string::npos);
  EXPECT_EQ(json::parse(line)["params"]["arguments"]["command"], "ls\n-la");
}

TEST_F(JsonUtilsTest, FindPath) {
  json root = json::parse(
      R"({"session": {"allowList": ["a"], "nested": {"depth": 2}}})");

  const json *found = findPath(root, "session.nested.depth");
  ASSERT_NE(found, nullptr);
  EXPECT_EQ(*found, 2);

  found = findPath(root, "session.allowList");
  ASSERT_NE(found, nullptr);
  EXPECT_TRUE(found->is_array());

  EXPECT_EQ(findPath(root, "session.missing"), nullptr);
  EXPECT_EQ(findPath(root, "session.allowList.x"), nullptr);
}
