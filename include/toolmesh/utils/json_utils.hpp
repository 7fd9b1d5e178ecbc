#ifndef TOOLMESH_UTILS_JSON_UTILS_HPP_
#define TOOLMESH_UTILS_JSON_UTILS_HPP_

#include "toolmesh/types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace toolmesh {
namespace json_utils {

/**
 * @brief Validate JSON against a schema
 *
 * @param json The JSON value to validate
 * @param schema The JSON schema to validate against
 * @param error_msg Optional output parameter for error message
 * @return true if validation succeeded, false otherwise
 */
bool validate(const nlohmann::json &json, const nlohmann::json &schema,
              std::string *error_msg = nullptr);

/**
 * @brief Parse a JSON string
 *
 * @param json_str The JSON string to parse
 * @return nlohmann::json The parsed JSON
 * @throws ProtocolException (ParseError) if parsing fails
 */
nlohmann::json parse(const std::string &json_str);

/**
 * @brief Kind of a JSON-RPC message
 */
enum class MessageType { Request, Notification, Response, Error };

/**
 * @brief Get the type of a JSON-RPC message
 *
 * @param json The JSON message
 * @return MessageType The message type
 * @throws ProtocolException (InvalidRequest) if the message is not a valid
 * JSON-RPC message
 */
MessageType getMessageType(const nlohmann::json &json);

/**
 * @brief Convert a JSON value into a typed JSON-RPC message
 *
 * @throws ProtocolException if the value is not a valid JSON-RPC message
 */
types::JSONRPCMessage toMessage(const nlohmann::json &json);

/**
 * @brief Parse a JSON-RPC message from a string
 *
 * @param json_str The JSON string to parse
 * @return types::JSONRPCMessage The parsed message
 * @throws ProtocolException if parsing fails or the message is malformed
 */
types::JSONRPCMessage parseMessage(const std::string &json_str);

/**
 * @brief Serialize a JSON-RPC message to a single-line string
 */
std::string serializeMessage(const types::JSONRPCMessage &message);

/**
 * @brief Read a value at a dotted path ("a.b.c")
 *
 * @return A pointer to the value, or nullptr when any segment is missing
 */
const nlohmann::json *findPath(const nlohmann::json &root,
                               const std::string &dotted_path);

} // namespace json_utils
} // namespace toolmesh

#endif // TOOLMESH_UTILS_JSON_UTILS_HPP_
