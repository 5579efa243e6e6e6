#include "transport_address.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace berth::machine {

PlatformFamily HostPlatformFamily() {
#ifdef _WIN32
  return PlatformFamily::kWindows;
#else
  return PlatformFamily::kUnix;
#endif
}

std::string TransportAddress::Uri() const {
  if (kind == AddressKind::kPipe) {
    std::string slashed = path;
    std::replace(slashed.begin(), slashed.end(), '\\', '/');
    return "npipe://" + slashed;
  }
  return "unix://" + path;
}

TransportAddress ResolveTransportAddress(PlatformFamily family, const berth::machine::v1::MachineConfig& config) {
  if (family == PlatformFamily::kWindows) {
    if (!config.has_api_pipe() || config.api_pipe().path().empty()) {
      throw util::TransportFailure("pipe of machine is not set");
    }
    return {AddressKind::kPipe, config.api_pipe().path()};
  }

  if (!config.has_api_socket() || config.api_socket().path().empty()) {
    throw util::TransportFailure("socket of machine is not set");
  }
  return {AddressKind::kSocket, config.api_socket().path()};
}

} // namespace berth::machine
