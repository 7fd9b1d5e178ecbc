#ifndef TOOLMESH_CONFIG_CONNECTION_BUILDER_HPP_
#define TOOLMESH_CONFIG_CONNECTION_BUILDER_HPP_

#include "toolmesh/config/session_config.hpp"
#include "toolmesh/transport/connection_params.hpp"
#include <nlohmann/json.hpp>

namespace toolmesh {
namespace config {

/**
 * @brief Turns a validated descriptor into transport connection parameters
 *
 * Performs no I/O. Relative arguments that end in the configured script
 * extension are resolved against the project root.
 */
class ConnectionBuilder {
public:
  explicit ConnectionBuilder(SessionConfig config);

  /**
   * @brief Build connection parameters for one server
   *
   * @param name The server name (for error messages)
   * @param descriptor The raw descriptor
   * @return transport::ConnectionParams The parameters
   * @throws ConfigurationException (MissingField) when `url` or `command` is
   * absent, (UnsupportedTransport) for any other transport value
   */
  transport::ConnectionParams build(const std::string &name,
                                    const nlohmann::json &descriptor) const;

  /**
   * @brief Resolve one argument the way build() does
   */
  std::string resolveArgument(const std::string &arg) const;

private:
  SessionConfig config_;
};

} // namespace config
} // namespace toolmesh

#endif // TOOLMESH_CONFIG_CONNECTION_BUILDER_HPP_
