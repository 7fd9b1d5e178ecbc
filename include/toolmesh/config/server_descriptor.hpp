#ifndef TOOLMESH_CONFIG_SERVER_DESCRIPTOR_HPP_
#define TOOLMESH_CONFIG_SERVER_DESCRIPTOR_HPP_

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace toolmesh {
namespace config {

/**
 * @brief One configured tool server
 *
 * The definition is kept exactly as configured (after legacy key
 * normalisation) so that validation can report on what is missing rather
 * than on what a typed parse already threw away. Recognised keys are
 * `transport`, `description`, `command`, `args`, `env`, `url` and `headers`.
 */
struct ServerDescriptor {
  std::string name;          ///< Unique key in the configuration
  nlohmann::json definition; ///< Raw descriptor object
};

using ServerDescriptors = std::vector<ServerDescriptor>;

} // namespace config
} // namespace toolmesh

#endif // TOOLMESH_CONFIG_SERVER_DESCRIPTOR_HPP_
