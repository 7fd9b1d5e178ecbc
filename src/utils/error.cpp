#include "toolmesh/utils/error.hpp"

namespace toolmesh {

ToolmeshException::ToolmeshException(types::ErrorData error)
    : std::runtime_error(error.message), error_(std::move(error)) {}

ToolmeshException::ToolmeshException(types::ErrorCode code,
                                     const std::string &message)
    : std::runtime_error(message),
      error_({static_cast<int>(code), message, nullptr}) {}

const types::ErrorData &ToolmeshException::error() const { return error_; }

types::ErrorData &ToolmeshException::error_data() { return error_; }

TransportException::TransportException(const std::string &message,
                                       const nlohmann::json &data)
    : ToolmeshException(types::ErrorCode::TransportError, message) {
  if (!data.is_null()) {
    error_data().data = data;
  }
}

TransportException::TransportException(types::ErrorCode code,
                                       const std::string &message,
                                       const nlohmann::json &data)
    : ToolmeshException(code, message) {
  if (!data.is_null()) {
    error_data().data = data;
  }
}

TransportException::TransportException(const std::error_code &error)
    : ToolmeshException(types::ErrorCode::TransportError, error.message()) {
  error_data().data = {{"category", error.category().name()},
                       {"value", error.value()}};
}

ProtocolException::ProtocolException(const std::string &message,
                                     const nlohmann::json &data)
    : ToolmeshException(types::ErrorCode::ProtocolError, message) {
  if (!data.is_null()) {
    error_data().data = data;
  }
}

ProtocolException::ProtocolException(types::ErrorCode code,
                                     const std::string &message,
                                     const nlohmann::json &data)
    : ToolmeshException(code, message) {
  if (!data.is_null()) {
    error_data().data = data;
  }
}

ProtocolException::ProtocolException(const types::ErrorData &error)
    : ToolmeshException(error) {}

TimeoutException::TimeoutException(const std::string &message,
                                   const nlohmann::json &data)
    : ToolmeshException(types::ErrorCode::TimeoutError, message) {
  if (!data.is_null()) {
    error_data().data = data;
  }
}

ConfigurationException::ConfigurationException(Kind kind,
                                               const std::string &message,
                                               const std::string &field,
                                               const nlohmann::json &value)
    : ToolmeshException(types::ErrorCode::ConfigurationError, message),
      kind_(kind), field_(field) {
  error_data().data = {{"kind", toString(kind)}};
  if (!field.empty()) {
    error_data().data["field"] = field;
  }
  if (!value.is_null()) {
    error_data().data["value"] = value;
  }
}

ConfigurationException::Kind ConfigurationException::kind() const {
  return kind_;
}

const std::string &ConfigurationException::field() const { return field_; }

SessionException::SessionException(Kind kind, const std::string &message)
    : ToolmeshException(types::ErrorCode::SessionError, message), kind_(kind) {
  error_data().data = {{"kind", kind == Kind::NotInitialized
                                    ? "NotInitialized"
                                    : "TurnInProgress"}};
}

SessionException::Kind SessionException::kind() const { return kind_; }

EngineException::EngineException(const std::string &message,
                                 const nlohmann::json &data)
    : ToolmeshException(types::ErrorCode::EngineError, message) {
  if (!data.is_null()) {
    error_data().data = data;
  }
}

std::string toString(ConfigurationException::Kind kind) {
  switch (kind) {
  case ConfigurationException::Kind::MissingField:
    return "MissingField";
  case ConfigurationException::Kind::InvalidTransport:
    return "InvalidTransport";
  case ConfigurationException::Kind::UnsupportedTransport:
    return "UnsupportedTransport";
  case ConfigurationException::Kind::InvalidDocument:
    return "InvalidDocument";
  }
  return "Unknown";
}

types::JSONRPCError createErrorResponse(const types::RequestId &id,
                                        const ToolmeshException &exception) {
  return {.jsonrpc = "2.0", .id = id, .error = exception.error()};
}

types::JSONRPCError createErrorResponse(const types::RequestId &id,
                                        const types::ErrorData &error) {
  return {.jsonrpc = "2.0", .id = id, .error = error};
}

types::JSONRPCError createErrorResponse(const types::RequestId &id,
                                        types::ErrorCode code,
                                        const std::string &message,
                                        const nlohmann::json &data) {
  return {.jsonrpc = "2.0",
          .id = id,
          .error = {.code = static_cast<int>(code),
                    .message = message,
                    .data = data}};
}

} // namespace toolmesh
