#include "toolmesh/transport/transport_factory.hpp"
#include "toolmesh/transport/http_transport.hpp"
#include "toolmesh/transport/process_transport.hpp"

namespace toolmesh {
namespace transport {

std::shared_ptr<Transport>
DefaultTransportFactory::create(const ConnectionParams &params) {
  if (const auto *process = std::get_if<ProcessParams>(&params)) {
    return std::make_shared<ProcessTransport>(*process);
  }
  return std::make_shared<HttpTransport>(std::get<NetworkParams>(params));
}

} // namespace transport
} // namespace toolmesh
