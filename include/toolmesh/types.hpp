#ifndef TOOLMESH_TYPES_HPP_
#define TOOLMESH_TYPES_HPP_

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace toolmesh {
namespace types {

/**
 * @brief Standard JSON-RPC 2.0 error codes and toolmesh-specific error codes
 */
enum class ErrorCode {
  // JSON-RPC 2.0 standard error codes
  ParseError = -32700,     ///< Invalid JSON was received
  InvalidRequest = -32600, ///< The JSON sent is not a valid Request object
  MethodNotFound = -32601, ///< The method does not exist / is not available
  InvalidParams = -32602,  ///< Invalid method parameter(s)
  InternalError = -32603,  ///< Internal JSON-RPC error

  // toolmesh-specific error codes
  ProtocolError = -32000,      ///< Protocol-related error
  TransportError = -32001,     ///< Transport-related error
  TimeoutError = -32002,       ///< Operation timed out
  NoActiveConnection = -32004, ///< No connection to the addressed server
  ConfigurationError = -32005, ///< Server descriptor or config document error
  SessionError = -32006,       ///< Session precondition violated
  EngineError = -32007         ///< Execution engine could not be constructed
};

/**
 * @brief Structure representing an error in JSON-RPC 2.0
 */
struct ErrorData {
  int code;            ///< Error code
  std::string message; ///< Error message
  nlohmann::json data; ///< Optional additional error data
};

/**
 * @brief JSON-RPC request identifier (string or integer)
 */
using RequestId = std::variant<std::string, int>;

/**
 * @brief Render a request identifier as a string key
 */
inline std::string idToString(const RequestId &id) {
  if (std::holds_alternative<std::string>(id)) {
    return std::get<std::string>(id);
  }
  return std::to_string(std::get<int>(id));
}

/**
 * @brief JSON-RPC 2.0 request message
 */
struct JSONRPCRequest {
  std::string jsonrpc = "2.0";          ///< JSON-RPC version (always "2.0")
  RequestId id;                         ///< Request identifier
  std::string method;                   ///< Method name
  std::optional<nlohmann::json> params; ///< Method parameters
};

/**
 * @brief JSON-RPC 2.0 notification message (request without id)
 */
struct JSONRPCNotification {
  std::string jsonrpc = "2.0";          ///< JSON-RPC version (always "2.0")
  std::string method;                   ///< Method name
  std::optional<nlohmann::json> params; ///< Method parameters
};

/**
 * @brief JSON-RPC 2.0 success response message
 */
struct JSONRPCResponse {
  std::string jsonrpc = "2.0"; ///< JSON-RPC version (always "2.0")
  RequestId id;                ///< Request identifier
  nlohmann::json result;       ///< Result data
};

/**
 * @brief JSON-RPC 2.0 error response message
 */
struct JSONRPCError {
  std::string jsonrpc = "2.0"; ///< JSON-RPC version (always "2.0")
  RequestId id;                ///< Request identifier
  ErrorData error;             ///< Error data
};

/**
 * @brief Variant type that can hold any JSON-RPC 2.0 message
 */
using JSONRPCMessage = std::variant<JSONRPCRequest, JSONRPCNotification,
                                    JSONRPCResponse, JSONRPCError>;

/**
 * @brief Tool descriptor as advertised by a tool server's catalog
 */
struct ToolDescriptor {
  std::string name;                           ///< Tool name
  std::string description;                    ///< Tool description
  std::optional<nlohmann::json> input_schema; ///< JSON Schema for the input
};

} // namespace types
} // namespace toolmesh

// JSON serialization/deserialization functions
namespace nlohmann {

template <> struct adl_serializer<toolmesh::types::ErrorCode> {
  static void to_json(json &j, const toolmesh::types::ErrorCode &code) {
    j = static_cast<int>(code);
  }

  static void from_json(const json &j, toolmesh::types::ErrorCode &code) {
    code = static_cast<toolmesh::types::ErrorCode>(j.get<int>());
  }
};

template <> struct adl_serializer<toolmesh::types::ErrorData> {
  static void to_json(json &j, const toolmesh::types::ErrorData &error) {
    j = json{{"code", error.code}, {"message", error.message}};
    if (!error.data.is_null()) {
      j["data"] = error.data;
    }
  }

  static void from_json(const json &j, toolmesh::types::ErrorData &error) {
    j.at("code").get_to(error.code);
    j.at("message").get_to(error.message);
    if (j.contains("data")) {
      error.data = j["data"];
    } else {
      error.data = nullptr;
    }
  }
};

template <> struct adl_serializer<toolmesh::types::RequestId> {
  static void to_json(json &j, const toolmesh::types::RequestId &id) {
    std::visit([&j](const auto &value) { j = value; }, id);
  }

  static void from_json(const json &j, toolmesh::types::RequestId &id) {
    if (j.is_string()) {
      id = j.get<std::string>();
    } else {
      id = j.get<int>();
    }
  }
};

template <> struct adl_serializer<toolmesh::types::JSONRPCRequest> {
  static void to_json(json &j, const toolmesh::types::JSONRPCRequest &request) {
    j = json::object();
    j["jsonrpc"] = request.jsonrpc;
    j["id"] = request.id;
    j["method"] = request.method;
    if (request.params) {
      j["params"] = *request.params;
    }
  }

  static void from_json(const json &j,
                        toolmesh::types::JSONRPCRequest &request) {
    j.at("jsonrpc").get_to(request.jsonrpc);
    j.at("id").get_to(request.id);
    j.at("method").get_to(request.method);
    if (j.contains("params")) {
      request.params = j["params"];
    }
  }
};

template <> struct adl_serializer<toolmesh::types::JSONRPCResponse> {
  static void to_json(json &j,
                      const toolmesh::types::JSONRPCResponse &response) {
    j = json::object();
    j["jsonrpc"] = response.jsonrpc;
    j["id"] = response.id;
    j["result"] = response.result;
  }

  static void from_json(const json &j,
                        toolmesh::types::JSONRPCResponse &response) {
    j.at("jsonrpc").get_to(response.jsonrpc);
    j.at("id").get_to(response.id);
    j.at("result").get_to(response.result);
  }
};

template <> struct adl_serializer<toolmesh::types::JSONRPCError> {
  static void to_json(json &j, const toolmesh::types::JSONRPCError &error) {
    j = json::object();
    j["jsonrpc"] = error.jsonrpc;
    j["id"] = error.id;
    j["error"] = error.error;
  }

  static void from_json(const json &j, toolmesh::types::JSONRPCError &error) {
    j.at("jsonrpc").get_to(error.jsonrpc);
    j.at("id").get_to(error.id);
    j.at("error").get_to(error.error);
  }
};

template <> struct adl_serializer<toolmesh::types::JSONRPCNotification> {
  static void
  to_json(json &j, const toolmesh::types::JSONRPCNotification &notification) {
    j = json::object();
    j["jsonrpc"] = notification.jsonrpc;
    j["method"] = notification.method;
    if (notification.params) {
      j["params"] = *notification.params;
    }
  }

  static void from_json(const json &j,
                        toolmesh::types::JSONRPCNotification &notification) {
    j.at("jsonrpc").get_to(notification.jsonrpc);
    j.at("method").get_to(notification.method);
    if (j.contains("params")) {
      notification.params = j["params"];
    }
  }
};

template <> struct adl_serializer<toolmesh::types::ToolDescriptor> {
  static void to_json(json &j, const toolmesh::types::ToolDescriptor &tool) {
    j = json::object();
    j["name"] = tool.name;
    j["description"] = tool.description;
    if (tool.input_schema) {
      j["inputSchema"] = *tool.input_schema;
    }
  }

  // Servers may omit the description; only the name is mandatory
  static void from_json(const json &j,
                        toolmesh::types::ToolDescriptor &tool) {
    j.at("name").get_to(tool.name);
    tool.description = j.value("description", std::string());
    if (j.contains("inputSchema")) {
      tool.input_schema = j["inputSchema"];
    } else {
      tool.input_schema.reset();
    }
  }
};

} // namespace nlohmann

#endif // TOOLMESH_TYPES_HPP_
