#include "toolmesh/config/config_loader.hpp"
#include "toolmesh/utils/error.hpp"
#include "toolmesh/utils/json_utils.hpp"
#include "toolmesh/utils/logging.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace toolmesh {
namespace config {

ConfigLoader::ConfigLoader(std::optional<std::filesystem::path> path,
                           std::filesystem::path project_root)
    : path_(resolvePath(path, project_root)),
      project_root_(std::move(project_root)) {}

std::filesystem::path
ConfigLoader::resolvePath(const std::optional<std::filesystem::path> &path,
                          const std::filesystem::path &project_root) {
  if (path && !path->empty()) {
    return *path;
  }
  if (const char *env_path = std::getenv("TOOLMESH_CONFIG_PATH")) {
    if (*env_path != '\0') {
      return std::filesystem::path(env_path);
    }
  }
  return project_root / "config" / "servers.json";
}

const std::filesystem::path &ConfigLoader::path() const { return path_; }

const nlohmann::json &ConfigLoader::documentSchema() {
  static const nlohmann::json schema = nlohmann::json::parse(R"({
    "$schema": "http://json-schema.org/draft-07/schema#",
    "title": "toolmesh configuration",
    "type": "object",
    "properties": {
      "mcpservers": {
        "type": "object",
        "additionalProperties": {"type": "object"}
      },
      "session": {
        "type": "object",
        "properties": {
          "allowList": {"type": "array", "items": {"type": "string"}},
          "connectionTimeout": {"type": "number", "exclusiveMinimum": 0},
          "requestTimeout": {"type": "number", "exclusiveMinimum": 0},
          "shutdownGracePeriodMs": {"type": "integer", "minimum": 0},
          "projectRoot": {"type": "string"},
          "scriptExtension": {"type": "string"},
          "agentName": {"type": "string"},
          "model": {"type": "string"},
          "systemInstruction": {"type": "string"},
          "clientName": {"type": "string"},
          "clientVersion": {"type": "string"}
        }
      },
      "logLevel": {"type": "string"}
    }
  })");
  return schema;
}

nlohmann::json ConfigLoader::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cache_) {
    return *cache_;
  }

  std::ifstream file(path_);
  if (!file) {
    TOOLMESH_LOG_ERROR("Configuration file not found at " + path_.string());
    throw ConfigurationException(
        ConfigurationException::Kind::InvalidDocument,
        "Configuration file not found at " + path_.string());
  }

  std::stringstream contents;
  contents << file.rdbuf();

  nlohmann::json document;
  try {
    document = json_utils::parse(contents.str());
  } catch (const ProtocolException &e) {
    TOOLMESH_LOG_ERROR("Invalid JSON in configuration file: " +
                       std::string(e.what()));
    throw ConfigurationException(
        ConfigurationException::Kind::InvalidDocument,
        "Invalid JSON in configuration file " + path_.string() + ": " +
            e.what());
  }

  std::string schema_error;
  if (!json_utils::validate(document, documentSchema(), &schema_error)) {
    TOOLMESH_LOG_ERROR("Configuration file " + path_.string() +
                       " does not match the schema: " + schema_error);
    throw ConfigurationException(
        ConfigurationException::Kind::InvalidDocument,
        "Configuration file " + path_.string() +
            " does not match the schema: " + schema_error);
  }

  cache_ = std::move(document);
  TOOLMESH_LOG_INFO("Loaded configuration from " + path_.string());
  return *cache_;
}

nlohmann::json ConfigLoader::reload() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.reset();
  }
  return load();
}

nlohmann::json ConfigLoader::normaliseDescriptor(const nlohmann::json &descriptor) {
  if (!descriptor.is_object() || descriptor.contains("transport") ||
      !descriptor.contains("type")) {
    return descriptor;
  }

  nlohmann::json normalised = descriptor;
  const nlohmann::json &legacy = descriptor["type"];
  if (legacy == "stdio") {
    normalised["transport"] = "process";
  } else if (legacy == "http") {
    normalised["transport"] = "network";
  } else {
    // Carried over as-is so that validation reports the bad value
    normalised["transport"] = legacy;
  }
  normalised.erase("type");
  return normalised;
}

ServerDescriptors ConfigLoader::serverDescriptors() {
  nlohmann::json document = load();

  ServerDescriptors descriptors;
  auto servers = document.find("mcpservers");
  if (servers == document.end()) {
    TOOLMESH_LOG_WARNING("Configuration has no 'mcpservers' section");
    return descriptors;
  }

  for (const auto &[name, definition] : servers->items()) {
    descriptors.push_back({name, normaliseDescriptor(definition)});
  }
  return descriptors;
}

SessionConfig ConfigLoader::sessionConfig() {
  SessionConfig base;
  base.project_root = project_root_;

  nlohmann::json document = load();
  auto section = document.find("session");
  if (section == document.end()) {
    return base;
  }
  return sessionConfigFromJson(*section, std::move(base));
}

nlohmann::json ConfigLoader::value(const std::string &dotted_path,
                                   const nlohmann::json &default_value) {
  try {
    nlohmann::json document = load();
    const nlohmann::json *found = json_utils::findPath(document, dotted_path);
    return found ? *found : default_value;
  } catch (const ConfigurationException &e) {
    TOOLMESH_LOG_WARNING("Error accessing configuration key '" + dotted_path +
                         "': " + e.what());
    return default_value;
  }
}

} // namespace config
} // namespace toolmesh
