#include "toolmesh/transport/connection_params.hpp"
#include <sstream>

namespace toolmesh {
namespace transport {

std::string toString(TransportKind kind) {
  switch (kind) {
  case TransportKind::Process:
    return "process";
  case TransportKind::Network:
    return "network";
  }
  return "unknown";
}

TransportKind kindOf(const ConnectionParams &params) {
  return std::holds_alternative<ProcessParams>(params)
             ? TransportKind::Process
             : TransportKind::Network;
}

std::string describe(const ConnectionParams &params) {
  std::ostringstream out;
  if (const auto *process = std::get_if<ProcessParams>(&params)) {
    out << "process: " << process->command;
    for (const auto &arg : process->args) {
      out << ' ' << arg;
    }
  } else {
    out << "network: " << std::get<NetworkParams>(params).url;
  }
  return out.str();
}

} // namespace transport
} // namespace toolmesh
