#ifndef TOOLMESH_CONFIG_CONFIG_LOADER_HPP_
#define TOOLMESH_CONFIG_CONFIG_LOADER_HPP_

#include "toolmesh/config/server_descriptor.hpp"
#include "toolmesh/config/session_config.hpp"
#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>

namespace toolmesh {
namespace config {

/**
 * @brief Loads the JSON configuration document
 *
 * The document looks like:
 * @code
 * {
 *   "mcpservers": {
 *     "terminal": {"transport": "process", "command": "python",
 *                  "args": ["servers/stdio/terminal_server.py"],
 *                  "description": "Shell commands"},
 *     "temperature": {"transport": "network",
 *                     "url": "http://localhost:8001/mcp",
 *                     "description": "Unit conversion"}
 *   },
 *   "session": {"allowList": [], "connectionTimeout": 30}
 * }
 * @endcode
 *
 * The file is read once and cached until reload().
 */
class ConfigLoader {
public:
  /**
   * @brief Construct a loader
   *
   * @param path Explicit document path; when empty the location comes from
   * TOOLMESH_CONFIG_PATH, else `<project_root>/config/servers.json`
   * @param project_root Base for the default location
   */
  explicit ConfigLoader(
      std::optional<std::filesystem::path> path = std::nullopt,
      std::filesystem::path project_root = defaultProjectRoot());

  /**
   * @brief Decide where the configuration document lives
   */
  static std::filesystem::path
  resolvePath(const std::optional<std::filesystem::path> &path,
              const std::filesystem::path &project_root);

  const std::filesystem::path &path() const;

  /**
   * @brief Load (or return the cached) document
   *
   * @return nlohmann::json A copy of the document; later reloads do not
   * affect it
   * @throws ConfigurationException (InvalidDocument) if the file is missing,
   * is not JSON or does not match the document schema
   */
  nlohmann::json load();

  /**
   * @brief Drop the cache and load again
   */
  nlohmann::json reload();

  /**
   * @brief Configured servers, legacy keys normalised, in name order
   */
  ServerDescriptors serverDescriptors();

  /**
   * @brief Session settings from the `session` section over the defaults
   */
  SessionConfig sessionConfig();

  /**
   * @brief Read a value at a dotted path, e.g. "session.allowList"
   *
   * Load failures are logged and yield the default.
   */
  nlohmann::json value(const std::string &dotted_path,
                       const nlohmann::json &default_value = nullptr);

  /**
   * @brief Map `type: stdio|http` onto `transport: process|network`
   */
  static nlohmann::json normaliseDescriptor(const nlohmann::json &descriptor);

  /**
   * @brief JSON Schema the document is validated against
   */
  static const nlohmann::json &documentSchema();

private:
  std::filesystem::path path_;
  std::filesystem::path project_root_;
  std::optional<nlohmann::json> cache_;
  std::mutex mutex_;
};

} // namespace config
} // namespace toolmesh

#endif // TOOLMESH_CONFIG_CONFIG_LOADER_HPP_
