#include "toolmesh/config/connection_builder.hpp"
#include "toolmesh/utils/error.hpp"
#include "toolmesh/utils/logging.hpp"
#include <filesystem>

namespace toolmesh {
namespace config {

namespace {

std::string requireString(const std::string &name,
                          const nlohmann::json &descriptor,
                          const char *field) {
  if (!descriptor.contains(field) || !descriptor[field].is_string() ||
      descriptor[field].get<std::string>().empty()) {
    throw ConfigurationException(
        ConfigurationException::Kind::MissingField,
        "Server '" + name + "' is missing required '" + field + "'", field);
  }
  return descriptor[field].get<std::string>();
}

std::map<std::string, std::string>
stringMap(const std::string &name, const nlohmann::json &descriptor,
          const char *field) {
  std::map<std::string, std::string> result;
  if (!descriptor.contains(field) || descriptor[field].is_null()) {
    return result;
  }
  if (!descriptor[field].is_object()) {
    throw ConfigurationException(
        ConfigurationException::Kind::InvalidTransport,
        "Server '" + name + "': '" + field + "' must be an object", field,
        descriptor[field]);
  }
  for (const auto &[key, value] : descriptor[field].items()) {
    result[key] = value.is_string() ? value.get<std::string>() : value.dump();
  }
  return result;
}

bool endsWith(const std::string &value, const std::string &suffix) {
  return !suffix.empty() && value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) ==
             0;
}

} // namespace

ConnectionBuilder::ConnectionBuilder(SessionConfig config)
    : config_(std::move(config)) {}

std::string ConnectionBuilder::resolveArgument(const std::string &arg) const {
  std::filesystem::path path(arg);
  if (path.is_absolute() || !endsWith(arg, config_.script_extension)) {
    return arg;
  }
  return (config_.project_root / path).lexically_normal().string();
}

transport::ConnectionParams
ConnectionBuilder::build(const std::string &name,
                         const nlohmann::json &descriptor) const {
  nlohmann::json kind =
      descriptor.contains("transport") ? descriptor["transport"] : nullptr;

  if (kind == "network") {
    transport::NetworkParams params;
    params.url = requireString(name, descriptor, "url");
    params.headers = stringMap(name, descriptor, "headers");
    params.timeout = config_.connection_timeout;
    TOOLMESH_LOG_DEBUG("Built network parameters for '" + name + "'");
    return params;
  }

  if (kind == "process") {
    transport::ProcessParams params;
    params.command = requireString(name, descriptor, "command");

    if (descriptor.contains("args") && !descriptor["args"].is_null()) {
      if (!descriptor["args"].is_array()) {
        throw ConfigurationException(
            ConfigurationException::Kind::InvalidTransport,
            "Server '" + name + "': 'args' must be an array", "args",
            descriptor["args"]);
      }
      for (const auto &arg : descriptor["args"]) {
        params.args.push_back(
            resolveArgument(arg.is_string() ? arg.get<std::string>()
                                            : arg.dump()));
      }
    }

    params.env = stringMap(name, descriptor, "env");
    params.timeout = config_.connection_timeout;
    TOOLMESH_LOG_DEBUG("Built process parameters for '" + name + "'");
    return params;
  }

  throw ConfigurationException(
      ConfigurationException::Kind::UnsupportedTransport,
      "Server '" + name + "' uses an unsupported transport", "transport",
      kind);
}

} // namespace config
} // namespace toolmesh
