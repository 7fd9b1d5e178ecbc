#ifndef TOOLMESH_TRANSPORT_CONNECTION_PARAMS_HPP_
#define TOOLMESH_TRANSPORT_CONNECTION_PARAMS_HPP_

#include <chrono>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace toolmesh {
namespace transport {

/**
 * @brief Transport kinds a server descriptor can name
 */
enum class TransportKind { Process, Network };

/**
 * @brief Parameters for a server spawned as a child process
 *
 * The child speaks newline-delimited JSON-RPC on its stdin/stdout.
 */
struct ProcessParams {
  std::string command;                    ///< Executable (looked up on PATH)
  std::vector<std::string> args;          ///< Argument vector after argv[0]
  std::map<std::string, std::string> env; ///< Extra environment entries
  std::chrono::milliseconds timeout = std::chrono::seconds(30);
};

/**
 * @brief Parameters for a server reached over HTTP
 */
struct NetworkParams {
  std::string url;
  std::map<std::string, std::string> headers; ///< Extra request headers
  std::chrono::milliseconds timeout = std::chrono::seconds(30);
};

using ConnectionParams = std::variant<ProcessParams, NetworkParams>;

/**
 * @brief Descriptor spelling of a transport kind ("process" or "network")
 */
std::string toString(TransportKind kind);

TransportKind kindOf(const ConnectionParams &params);

/**
 * @brief One-line human-readable rendering, used in logs
 */
std::string describe(const ConnectionParams &params);

} // namespace transport
} // namespace toolmesh

#endif // TOOLMESH_TRANSPORT_CONNECTION_PARAMS_HPP_
