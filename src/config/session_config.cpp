#include "toolmesh/config/session_config.hpp"
#include <cstdlib>

namespace toolmesh {
namespace config {

namespace {

std::chrono::milliseconds secondsValue(const nlohmann::json &value) {
  return std::chrono::milliseconds(
      static_cast<long long>(value.get<double>() * 1000.0));
}

} // namespace

std::filesystem::path defaultProjectRoot() {
  if (const char *root = std::getenv("TOOLMESH_PROJECT_ROOT")) {
    if (*root != '\0') {
      return std::filesystem::path(root);
    }
  }
  return std::filesystem::current_path();
}

SessionConfig defaultSessionConfig() {
  SessionConfig config;
  config.project_root = defaultProjectRoot();
  return config;
}

SessionConfig sessionConfigFromJson(const nlohmann::json &section,
                                    SessionConfig base) {
  if (!section.is_object()) {
    return base;
  }

  if (section.contains("allowList")) {
    base.allow_list = section["allowList"].get<std::vector<std::string>>();
  }
  if (section.contains("connectionTimeout")) {
    base.connection_timeout = secondsValue(section["connectionTimeout"]);
  }
  if (section.contains("requestTimeout")) {
    base.request_timeout = secondsValue(section["requestTimeout"]);
  }
  if (section.contains("projectRoot")) {
    std::filesystem::path root = section["projectRoot"].get<std::string>();
    base.project_root = root.is_absolute() ? root : base.project_root / root;
  }
  if (section.contains("scriptExtension")) {
    base.script_extension = section["scriptExtension"].get<std::string>();
  }
  if (section.contains("shutdownGracePeriodMs")) {
    base.shutdown_grace_period = std::chrono::milliseconds(
        section["shutdownGracePeriodMs"].get<long long>());
  }
  base.agent_name = section.value("agentName", base.agent_name);
  base.model_name = section.value("model", base.model_name);
  base.system_instruction =
      section.value("systemInstruction", base.system_instruction);
  base.client_name = section.value("clientName", base.client_name);
  base.client_version = section.value("clientVersion", base.client_version);

  return base;
}

} // namespace config
} // namespace toolmesh
