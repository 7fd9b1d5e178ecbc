#ifndef TOOLMESH_TRANSPORT_TRANSPORT_FACTORY_HPP_
#define TOOLMESH_TRANSPORT_TRANSPORT_FACTORY_HPP_

#include "toolmesh/transport/connection_params.hpp"
#include "toolmesh/transport/transport.hpp"
#include <memory>

namespace toolmesh {
namespace transport {

/**
 * @brief Creates the transport matching a set of connection parameters
 */
class TransportFactory {
public:
  virtual ~TransportFactory() = default;

  /**
   * @brief Create an unconnected transport
   *
   * @param params The connection parameters
   * @return std::shared_ptr<Transport> The new transport
   */
  virtual std::shared_ptr<Transport>
  create(const ConnectionParams &params) = 0;
};

/**
 * @brief Factory producing ProcessTransport and HttpTransport instances
 */
class DefaultTransportFactory : public TransportFactory {
public:
  std::shared_ptr<Transport> create(const ConnectionParams &params) override;
};

} // namespace transport
} // namespace toolmesh

#endif // TOOLMESH_TRANSPORT_TRANSPORT_FACTORY_HPP_
