#pragma once

#include <string>

#include "berth/machine/v1/machine.pb.h"

namespace berth::machine {

enum class PlatformFamily {
  kUnix,
  kWindows,
};

// Family of the build target.
PlatformFamily HostPlatformFamily();

enum class AddressKind {
  kSocket,
  kPipe,
};

/*
  Resolved machine endpoint. Derived on every negotiation; never cached
  across machine restarts.
*/
struct TransportAddress {
  AddressKind kind = AddressKind::kSocket;
  std::string path;

  // unix:///run/... or npipe:////./pipe/... (separators become '/')
  std::string Uri() const;
};

/*
  Picks the connection artifact of `family` from the machine config:
  the pipe on Windows, the API socket elsewhere. The other family's
  artifact is never used as a fallback; an unset artifact throws
  util::TransportFailure.
*/
TransportAddress ResolveTransportAddress(PlatformFamily family, const berth::machine::v1::MachineConfig& config);

} // namespace berth::machine
