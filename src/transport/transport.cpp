#include "toolmesh/transport/transport.hpp"

namespace toolmesh {
namespace transport {

namespace {
class TransportErrorCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "toolmesh.transport"; }

  std::string message(int ev) const override {
    switch (static_cast<TransportError>(ev)) {
    case TransportError::Timeout:
      return "Operation timed out";
    case TransportError::Disconnected:
      return "Transport disconnected";
    case TransportError::WriteError:
      return "Write error";
    case TransportError::ReadError:
      return "Read error";
    case TransportError::SpawnError:
      return "Failed to spawn server process";
    case TransportError::HttpError:
      return "HTTP request failed";
    default:
      return "Unknown error";
    }
  }
};
} // namespace

const std::error_category &transport_category() {
  static TransportErrorCategory category;
  return category;
}

std::error_code make_error_code(TransportError e) {
  return {static_cast<int>(e), transport_category()};
}

} // namespace transport
} // namespace toolmesh
