#ifndef TOOLMESH_CONFIG_CONFIGURATION_VALIDATOR_HPP_
#define TOOLMESH_CONFIG_CONFIGURATION_VALIDATOR_HPP_

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace toolmesh {
namespace config {

/**
 * @brief Outcome of validating one server descriptor
 */
struct ValidationResult {
  bool is_valid = true;
  std::vector<std::string> missing_fields;
  std::vector<std::string> invalid_fields;
  std::optional<std::string> error_message; ///< Set only when invalid
};

/**
 * @brief Checks a raw server descriptor before any connection attempt
 *
 * Required everywhere: `transport` and `description`. `transport` must be
 * "process" (which requires `command`) or "network" (which requires `url`).
 */
class ConfigurationValidator {
public:
  /**
   * @brief Validate one descriptor
   *
   * Never throws. Invalid results are logged as warnings.
   *
   * @param name The server name, used in the error message
   * @param descriptor The raw descriptor
   * @return ValidationResult The result
   */
  ValidationResult validate(const std::string &name,
                            const nlohmann::json &descriptor) const;
};

} // namespace config
} // namespace toolmesh

#endif // TOOLMESH_CONFIG_CONFIGURATION_VALIDATOR_HPP_
