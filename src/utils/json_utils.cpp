#include "toolmesh/utils/json_utils.hpp"
#include "toolmesh/utils/error.hpp"
#include <nlohmann/json-schema.hpp>

namespace toolmesh {
namespace json_utils {

bool validate(const nlohmann::json &json, const nlohmann::json &schema,
              std::string *error_msg) {
  try {
    nlohmann::json_schema::json_validator validator;
    validator.set_root_schema(schema);
    validator.validate(json);
    return true;
  } catch (const std::exception &e) {
    if (error_msg) {
      *error_msg = e.what();
    }
    return false;
  }
}

nlohmann::json parse(const std::string &json_str) {
  try {
    return nlohmann::json::parse(json_str);
  } catch (const nlohmann::json::parse_error &e) {
    throw ProtocolException(types::ErrorCode::ParseError,
                            "JSON parse error: " + std::string(e.what()));
  }
}

MessageType getMessageType(const nlohmann::json &json) {
  if (!json.is_object() || !json.contains("jsonrpc") ||
      json["jsonrpc"] != "2.0") {
    throw ProtocolException(
        types::ErrorCode::InvalidRequest,
        "Invalid JSON-RPC message: missing or invalid jsonrpc version");
  }

  if (json.contains("error") && json.contains("id")) {
    return MessageType::Error;
  }

  if (json.contains("result") && json.contains("id")) {
    return MessageType::Response;
  }

  if (json.contains("method")) {
    if (json.contains("id")) {
      return MessageType::Request;
    }
    return MessageType::Notification;
  }

  throw ProtocolException(
      types::ErrorCode::InvalidRequest,
      "Invalid JSON-RPC message: cannot determine message type");
}

types::JSONRPCMessage toMessage(const nlohmann::json &json) {
  MessageType type = getMessageType(json);

  try {
    switch (type) {
    case MessageType::Request:
      return json.get<types::JSONRPCRequest>();
    case MessageType::Notification:
      return json.get<types::JSONRPCNotification>();
    case MessageType::Response:
      return json.get<types::JSONRPCResponse>();
    case MessageType::Error:
      return json.get<types::JSONRPCError>();
    }
  } catch (const nlohmann::json::exception &e) {
    throw ProtocolException(types::ErrorCode::InvalidRequest,
                            "JSON-RPC message parse error: " +
                                std::string(e.what()));
  }

  throw ProtocolException(types::ErrorCode::InvalidRequest,
                          "Unknown message type");
}

types::JSONRPCMessage parseMessage(const std::string &json_str) {
  return toMessage(parse(json_str));
}

std::string serializeMessage(const types::JSONRPCMessage &message) {
  return std::visit([](const auto &msg) { return nlohmann::json(msg).dump(); },
                    message);
}

const nlohmann::json *findPath(const nlohmann::json &root,
                               const std::string &dotted_path) {
  const nlohmann::json *current = &root;
  std::size_t start = 0;

  while (start <= dotted_path.size()) {
    std::size_t dot = dotted_path.find('.', start);
    std::string key = dotted_path.substr(
        start, dot == std::string::npos ? std::string::npos : dot - start);

    if (!current->is_object()) {
      return nullptr;
    }
    auto it = current->find(key);
    if (it == current->end()) {
      return nullptr;
    }
    current = &(*it);

    if (dot == std::string::npos) {
      break;
    }
    start = dot + 1;
  }

  return current;
}

} // namespace json_utils
} // namespace toolmesh
