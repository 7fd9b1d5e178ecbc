#ifndef TOOLMESH_UTILS_DIAGNOSTICS_HPP_
#define TOOLMESH_UTILS_DIAGNOSTICS_HPP_

#include <functional>
#include <nlohmann/json.hpp>
#include <string>

namespace toolmesh {
namespace diagnostics {

/**
 * @brief Self-describing record of one observed event or operation outcome
 */
struct DiagnosticRecord {
  bool success = true;
  std::string timestamp; ///< UTC, ISO 8601 with milliseconds
  std::string message;
  nlohmann::json data;     ///< Payload; null when absent
  nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief Receives diagnostic records (debug mode only)
 */
using DiagnosticSink = std::function<void(const DiagnosticRecord &)>;

/**
 * @brief Current UTC time as "YYYY-mm-ddTHH:MM:SS.mmmZ"
 */
std::string utcTimestamp();

/**
 * @brief Build a success record stamped with the current time
 */
DiagnosticRecord makeSuccessRecord(nlohmann::json data,
                                   const std::string &message = "",
                                   nlohmann::json metadata = nullptr);

/**
 * @brief Build an error record; `error_code` lands in the metadata
 */
DiagnosticRecord makeErrorRecord(const std::string &error,
                                 const std::string &error_code = "",
                                 nlohmann::json metadata = nullptr);

nlohmann::json toJson(const DiagnosticRecord &record);

/**
 * @brief Multi-line rendering for terminals
 */
std::string toHumanReadable(const DiagnosticRecord &record);

} // namespace diagnostics
} // namespace toolmesh

#endif // TOOLMESH_UTILS_DIAGNOSTICS_HPP_
