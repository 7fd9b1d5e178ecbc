#ifndef TOOLMESH_UTILS_ERROR_HPP_
#define TOOLMESH_UTILS_ERROR_HPP_

#include "toolmesh/types.hpp"
#include <stdexcept>
#include <string>
#include <system_error>

namespace toolmesh {

/**
 * @brief Base exception class for toolmesh errors
 *
 * This class extends std::runtime_error and carries JSON-RPC error data so
 * that any failure can be turned into an error response without loss.
 */
class ToolmeshException : public std::runtime_error {
public:
  /**
   * @brief Construct a new ToolmeshException with error data
   *
   * @param error The error data
   */
  explicit ToolmeshException(types::ErrorData error);

  /**
   * @brief Construct a new ToolmeshException with error code and message
   *
   * @param code The error code
   * @param message The error message
   */
  explicit ToolmeshException(types::ErrorCode code, const std::string &message);

  /**
   * @brief Get the error data
   *
   * @return const types::ErrorData& The error data
   */
  const types::ErrorData &error() const;

protected:
  types::ErrorData &error_data();

private:
  types::ErrorData error_; ///< The error data
};

/**
 * @brief Exception for transport-related errors (connection failures)
 */
class TransportException : public ToolmeshException {
public:
  explicit TransportException(const std::string &message,
                              const nlohmann::json &data = nullptr);

  explicit TransportException(types::ErrorCode code, const std::string &message,
                              const nlohmann::json &data = nullptr);

  /**
   * @brief Construct a new TransportException from a std::error_code
   *
   * @param error The std::error_code
   */
  explicit TransportException(const std::error_code &error);
};

/**
 * @brief Exception for protocol-related errors
 */
class ProtocolException : public ToolmeshException {
public:
  explicit ProtocolException(const std::string &message,
                             const nlohmann::json &data = nullptr);

  explicit ProtocolException(types::ErrorCode code, const std::string &message,
                             const nlohmann::json &data = nullptr);

  /**
   * @brief Construct a new ProtocolException from a received error payload
   *
   * @param error The error data
   */
  explicit ProtocolException(const types::ErrorData &error);
};

/**
 * @brief Exception for timeout errors
 */
class TimeoutException : public ToolmeshException {
public:
  explicit TimeoutException(const std::string &message,
                            const nlohmann::json &data = nullptr);
};

/**
 * @brief Exception for invalid server descriptors and config documents
 */
class ConfigurationException : public ToolmeshException {
public:
  /**
   * @brief Kind of configuration problem
   */
  enum class Kind {
    MissingField,         ///< A required field is absent
    InvalidTransport,     ///< The transport value is malformed
    UnsupportedTransport, ///< The transport value is not one we can build
    InvalidDocument       ///< The configuration document itself is unusable
  };

  /**
   * @brief Construct a new ConfigurationException
   *
   * @param kind The kind of problem
   * @param message The error message
   * @param field The offending field name, if any
   * @param value The offending value, if any
   */
  ConfigurationException(Kind kind, const std::string &message,
                         const std::string &field = "",
                         const nlohmann::json &value = nullptr);

  Kind kind() const;

  /**
   * @brief The field the error refers to (empty for document errors)
   */
  const std::string &field() const;

private:
  Kind kind_;
  std::string field_;
};

/**
 * @brief Exception for session precondition violations
 */
class SessionException : public ToolmeshException {
public:
  enum class Kind {
    NotInitialized, ///< The session is not ready (or already terminated)
    TurnInProgress  ///< Another turn has not completed yet
  };

  SessionException(Kind kind, const std::string &message);

  Kind kind() const;

private:
  Kind kind_;
};

/**
 * @brief Fatal failure to construct the execution engine
 */
class EngineException : public ToolmeshException {
public:
  explicit EngineException(const std::string &message,
                           const nlohmann::json &data = nullptr);
};

/**
 * @brief Human-readable name for a configuration error kind
 */
std::string toString(ConfigurationException::Kind kind);

/**
 * @brief Create an error response from an exception
 *
 * @param id The request ID
 * @param exception The exception
 * @return types::JSONRPCError The error response
 */
types::JSONRPCError createErrorResponse(const types::RequestId &id,
                                        const ToolmeshException &exception);

/**
 * @brief Create an error response from error data
 */
types::JSONRPCError createErrorResponse(const types::RequestId &id,
                                        const types::ErrorData &error);

/**
 * @brief Create an error response from error code and message
 */
types::JSONRPCError createErrorResponse(const types::RequestId &id,
                                        types::ErrorCode code,
                                        const std::string &message,
                                        const nlohmann::json &data = nullptr);

} // namespace toolmesh

#endif // TOOLMESH_UTILS_ERROR_HPP_
