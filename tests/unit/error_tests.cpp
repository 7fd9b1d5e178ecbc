#include "toolmesh/transport/transport.hpp"
#include "toolmesh/utils/error.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace toolmesh;
using namespace toolmesh::types;
using json = nlohmann::json;

class ErrorTest : public ::testing::Test {};

TEST_F(ErrorTest, ToolmeshExceptionWithErrorData) {
  ErrorData error_data{static_cast<int>(ErrorCode::InvalidParams),
                       "Invalid parameters", json{{"param", "value"}}};

  ToolmeshException exception(error_data);

  EXPECT_EQ(exception.what(), std::string("Invalid parameters"));
  EXPECT_EQ(exception.error().code, static_cast<int>(ErrorCode::InvalidParams));
  EXPECT_EQ(exception.error().data["param"], "value");
}

TEST_F(ErrorTest, ToolmeshExceptionWithErrorCode) {
  ToolmeshException exception(ErrorCode::InvalidRequest, "Invalid request");

  EXPECT_EQ(exception.what(), std::string("Invalid request"));
  EXPECT_EQ(exception.error().code,
            static_cast<int>(ErrorCode::InvalidRequest));
  EXPECT_TRUE(exception.error().data.is_null());
}

TEST_F(ErrorTest, TransportException) {
  TransportException exception("Transport error",
                               json{{"details", "connection failed"}});

  EXPECT_EQ(exception.error().code,
            static_cast<int>(ErrorCode::TransportError));
  EXPECT_EQ(exception.error().data["details"], "connection failed");
}

TEST_F(ErrorTest, TransportExceptionFromErrorCode) {
  TransportException exception(
      transport::make_error_code(transport::TransportError::SpawnError));

  EXPECT_EQ(exception.error().code,
            static_cast<int>(ErrorCode::TransportError));
  EXPECT_EQ(exception.error().data["value"],
            static_cast<int>(transport::TransportError::SpawnError));
  EXPECT_FALSE(std::string(exception.what()).empty());
}

TEST_F(ErrorTest, NoActiveConnectionIsATransportException) {
  TransportException exception(ErrorCode::NoActiveConnection, "gone");

  EXPECT_EQ(exception.error().code,
            static_cast<int>(ErrorCode::NoActiveConnection));
}

TEST_F(ErrorTest, ProtocolExceptionKeepsServerError) {
  ErrorData received{static_cast<int>(ErrorCode::MethodNotFound),
                     "Method not found", json{{"method", "tools/call"}}};

  ProtocolException exception(received);

  EXPECT_EQ(exception.error().code,
            static_cast<int>(ErrorCode::MethodNotFound));
  EXPECT_EQ(exception.error().data["method"], "tools/call");
}

TEST_F(ErrorTest, TimeoutException) {
  TimeoutException exception("Request timed out");

  EXPECT_EQ(exception.error().code, static_cast<int>(ErrorCode::TimeoutError));
}

TEST_F(ErrorTest, ConfigurationExceptionCarriesKindAndField) {
  ConfigurationException exception(
      ConfigurationException::Kind::UnsupportedTransport,
      "Server 'x' uses an unsupported transport", "transport", "carrier-pigeon");

  EXPECT_EQ(exception.kind(),
            ConfigurationException::Kind::UnsupportedTransport);
  EXPECT_EQ(exception.field(), "transport");
  EXPECT_EQ(exception.error().code,
            static_cast<int>(ErrorCode::ConfigurationError));
  EXPECT_EQ(exception.error().data["kind"], "UnsupportedTransport");
  EXPECT_EQ(exception.error().data["field"], "transport");
  EXPECT_EQ(exception.error().data["value"], "carrier-pigeon");
}

TEST_F(ErrorTest, ConfigurationExceptionForDocument) {
  ConfigurationException exception(
      ConfigurationException::Kind::InvalidDocument, "not found");

  EXPECT_TRUE(exception.field().empty());
  EXPECT_FALSE(exception.error().data.contains("field"));
  EXPECT_EQ(toString(exception.kind()), "InvalidDocument");
}

TEST_F(ErrorTest, SessionException) {
  SessionException exception(SessionException::Kind::TurnInProgress, "busy");

  EXPECT_EQ(exception.kind(), SessionException::Kind::TurnInProgress);
  EXPECT_EQ(exception.error().code, static_cast<int>(ErrorCode::SessionError));
  EXPECT_EQ(exception.error().data["kind"], "TurnInProgress");
}

TEST_F(ErrorTest, EngineException) {
  EngineException exception("no model", json{{"agent", "a"}});

  EXPECT_EQ(exception.error().code, static_cast<int>(ErrorCode::EngineError));
  EXPECT_EQ(exception.error().data["agent"], "a");
}

TEST_F(ErrorTest, CreateErrorResponseFromException) {
  ProtocolException exception(ErrorCode::InvalidParams, "bad params",
                              json{{"param", "celsius"}});

  JSONRPCError response = createErrorResponse(RequestId("9_00000009"),
                                              exception);

  EXPECT_EQ(std::get<std::string>(response.id), "9_00000009");
  EXPECT_EQ(response.error.code, static_cast<int>(ErrorCode::InvalidParams));
  EXPECT_EQ(response.error.message, "bad params");
  EXPECT_EQ(response.error.data["param"], "celsius");
}

TEST_F(ErrorTest, CreateErrorResponseFromCode) {
  JSONRPCError response = createErrorResponse(RequestId(3),
                                              ErrorCode::InternalError, "boom");

  json j = response;
  EXPECT_EQ(j["id"], 3);
  EXPECT_EQ(j["error"]["code"], -32603);
  EXPECT_FALSE(j["error"].contains("data"));
}

TEST_F(ErrorTest, TransportCategoryMessages) {
  std::error_code timeout =
      transport::make_error_code(transport::TransportError::Timeout);

  EXPECT_EQ(&timeout.category(), &transport::transport_category());
  EXPECT_FALSE(timeout.message().empty());
  EXPECT_NE(timeout.message(),
            transport::make_error_code(transport::TransportError::HttpError)
                .message());
}
