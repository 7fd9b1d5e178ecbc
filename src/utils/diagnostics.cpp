#include "toolmesh/utils/diagnostics.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace toolmesh {
namespace diagnostics {

std::string utcTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch())
                    .count() %
                1000;

  std::tm utc{};
  gmtime_r(&time, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
      << std::setw(3) << millis << 'Z';
  return out.str();
}

DiagnosticRecord makeSuccessRecord(nlohmann::json data,
                                   const std::string &message,
                                   nlohmann::json metadata) {
  DiagnosticRecord record;
  record.success = true;
  record.timestamp = utcTimestamp();
  record.message =
      message.empty() ? "Operation completed successfully" : message;
  record.data = std::move(data);
  if (metadata.is_object()) {
    record.metadata = std::move(metadata);
  }
  return record;
}

DiagnosticRecord makeErrorRecord(const std::string &error,
                                 const std::string &error_code,
                                 nlohmann::json metadata) {
  DiagnosticRecord record;
  record.success = false;
  record.timestamp = utcTimestamp();
  record.message = "Error: " + error;
  if (metadata.is_object()) {
    record.metadata = std::move(metadata);
  }
  if (!error_code.empty()) {
    record.metadata["error_code"] = error_code;
  }
  return record;
}

nlohmann::json toJson(const DiagnosticRecord &record) {
  return {{"success", record.success},
          {"timestamp", record.timestamp},
          {"message", record.message},
          {"data", record.data},
          {"metadata", record.metadata}};
}

std::string toHumanReadable(const DiagnosticRecord &record) {
  std::ostringstream out;
  out << "Status: " << (record.success ? "SUCCESS" : "ERROR") << '\n';
  if (!record.timestamp.empty()) {
    out << "Timestamp: " << record.timestamp << '\n';
  }
  if (!record.message.empty()) {
    out << "Message: " << record.message << '\n';
  }
  if (!record.data.is_null()) {
    out << "Data:\n"
        << (record.data.is_string() ? record.data.get<std::string>()
                                    : record.data.dump(2))
        << '\n';
  }
  if (!record.metadata.empty()) {
    out << "Metadata:\n" << record.metadata.dump(2) << '\n';
  }

  std::string text = out.str();
  if (!text.empty()) {
    text.pop_back();
  }
  return text;
}

} // namespace diagnostics
} // namespace toolmesh
