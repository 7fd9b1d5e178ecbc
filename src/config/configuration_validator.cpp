#include "toolmesh/config/configuration_validator.hpp"
#include "toolmesh/utils/logging.hpp"

namespace toolmesh {
namespace config {

namespace {

bool hasField(const nlohmann::json &descriptor, const char *field) {
  return descriptor.contains(field) && !descriptor[field].is_null();
}

std::string renderValue(const nlohmann::json &value) {
  return value.is_string() ? value.get<std::string>() : value.dump();
}

std::string joinList(const std::vector<std::string> &items) {
  std::string result = "[";
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      result += ", ";
    }
    result += items[i];
  }
  return result + "]";
}

} // namespace

ValidationResult
ConfigurationValidator::validate(const std::string &name,
                                 const nlohmann::json &descriptor) const {
  ValidationResult result;

  if (!descriptor.is_object()) {
    result.invalid_fields.push_back("descriptor must be an object");
  } else {
    for (const char *field : {"transport", "description"}) {
      if (!hasField(descriptor, field)) {
        result.missing_fields.push_back(field);
      }
    }

    nlohmann::json transport =
        descriptor.contains("transport") ? descriptor["transport"] : nullptr;

    if (transport == "network") {
      if (!hasField(descriptor, "url")) {
        result.missing_fields.push_back("url");
      }
    } else if (transport == "process") {
      if (!hasField(descriptor, "command")) {
        result.missing_fields.push_back("command");
      }
    } else {
      result.invalid_fields.push_back("transport: '" + renderValue(transport) +
                                      "' is not supported");
    }
  }

  result.is_valid =
      result.missing_fields.empty() && result.invalid_fields.empty();

  if (!result.is_valid) {
    std::string message = "Server '" + name + "' configuration invalid";
    if (!result.missing_fields.empty()) {
      message += " - Missing fields: " + joinList(result.missing_fields);
    }
    if (!result.invalid_fields.empty()) {
      message += " - Invalid fields: " + joinList(result.invalid_fields);
    }
    TOOLMESH_LOG_WARNING(message);
    result.error_message = std::move(message);
  } else {
    TOOLMESH_LOG_DEBUG("Server '" + name + "' configuration is valid");
  }

  return result;
}

} // namespace config
} // namespace toolmesh
