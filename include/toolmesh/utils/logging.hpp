#ifndef TOOLMESH_UTILS_LOGGING_HPP_
#define TOOLMESH_UTILS_LOGGING_HPP_

#include <functional>
#include <string>

namespace toolmesh {
namespace logging {

/**
 * @brief Log levels
 */
enum class Level { Trace, Debug, Info, Warning, Error, Fatal };

/**
 * @brief Convert a log level to a string
 *
 * @param level The log level
 * @return std::string The string representation
 */
std::string levelToString(Level level);

/**
 * @brief Parse a log level from a string (case-insensitive)
 *
 * @param level_str The string representation
 * @return Level The log level
 * @throws std::invalid_argument if the string is not a valid log level
 */
Level levelFromString(const std::string &level_str);

/**
 * @brief Log handler function type
 */
using LogHandler = std::function<void(Level level, const std::string &message,
                                      const std::string &file, int line)>;

void setLevel(Level level);

Level getLevel();

/**
 * @brief Set the global log handler
 *
 * Passing an empty handler restores the default stderr handler.
 */
void setHandler(LogHandler handler);

/**
 * @brief Log a message
 *
 * @param level The log level
 * @param message The log message
 * @param file The source file
 * @param line The source line
 */
void log(Level level, const std::string &message, const std::string &file = "",
         int line = 0);

bool isEnabled(Level level);

/**
 * @brief Apply the level named by the TOOLMESH_LOG_LEVEL environment variable
 *
 * An unset variable leaves the level unchanged; an unparsable value is
 * reported as a warning and ignored.
 */
void configureFromEnvironment();

/**
 * @brief Default log handler that logs to stderr
 */
void defaultHandler(Level level, const std::string &message,
                    const std::string &file, int line);

/**
 * @brief Installs a handler for the lifetime of the object
 *
 * The previous handler is restored on destruction.
 */
class ScopedHandler {
public:
  explicit ScopedHandler(LogHandler handler);
  ~ScopedHandler();

  ScopedHandler(const ScopedHandler &) = delete;
  ScopedHandler &operator=(const ScopedHandler &) = delete;

private:
  LogHandler previous_;
};

} // namespace logging
} // namespace toolmesh

// Convenience macros for logging
#define TOOLMESH_LOG_TRACE(msg)                                                \
  do {                                                                         \
    if (toolmesh::logging::isEnabled(toolmesh::logging::Level::Trace)) {       \
      toolmesh::logging::log(toolmesh::logging::Level::Trace, msg, __FILE__,   \
                             __LINE__);                                        \
    }                                                                          \
  } while (0)

#define TOOLMESH_LOG_DEBUG(msg)                                                \
  do {                                                                         \
    if (toolmesh::logging::isEnabled(toolmesh::logging::Level::Debug)) {       \
      toolmesh::logging::log(toolmesh::logging::Level::Debug, msg, __FILE__,   \
                             __LINE__);                                        \
    }                                                                          \
  } while (0)

#define TOOLMESH_LOG_INFO(msg)                                                 \
  do {                                                                         \
    if (toolmesh::logging::isEnabled(toolmesh::logging::Level::Info)) {        \
      toolmesh::logging::log(toolmesh::logging::Level::Info, msg, __FILE__,    \
                             __LINE__);                                        \
    }                                                                          \
  } while (0)

#define TOOLMESH_LOG_WARNING(msg)                                              \
  do {                                                                         \
    if (toolmesh::logging::isEnabled(toolmesh::logging::Level::Warning)) {     \
      toolmesh::logging::log(toolmesh::logging::Level::Warning, msg, __FILE__, \
                             __LINE__);                                        \
    }                                                                          \
  } while (0)

#define TOOLMESH_LOG_ERROR(msg)                                                \
  do {                                                                         \
    if (toolmesh::logging::isEnabled(toolmesh::logging::Level::Error)) {       \
      toolmesh::logging::log(toolmesh::logging::Level::Error, msg, __FILE__,   \
                             __LINE__);                                        \
    }                                                                          \
  } while (0)

#define TOOLMESH_LOG_FATAL(msg)                                                \
  do {                                                                         \
    if (toolmesh::logging::isEnabled(toolmesh::logging::Level::Fatal)) {       \
      toolmesh::logging::log(toolmesh::logging::Level::Fatal, msg, __FILE__,   \
                             __LINE__);                                        \
    }                                                                          \
  } while (0)

#endif // TOOLMESH_UTILS_LOGGING_HPP_
