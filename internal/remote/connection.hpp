#pragma once

#include <grpcpp/grpcpp.h>

#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "berth/machine/v1/machine.pb.h"
#include "internal/engine/connection_descriptor.hpp"
#include "internal/machine/transport_address.hpp"
#include "internal/machine/vm_stubber.hpp"
#include "internal/remote/client_context.hpp"

namespace berth::remote {

using ChannelFactory =
    std::function<std::shared_ptr<::grpc::Channel>(const std::string& target, const std::shared_ptr<::grpc::ChannelCredentials>& creds)>;

using StubberLookup = std::function<std::unique_ptr<machine::VmStubber>(const std::string& provider)>;

using MachineConfigLoader =
    std::function<berth::machine::v1::MachineConfig(const std::filesystem::path& config_dir, const std::string& name)>;

// Seams for negotiation; unset members fall back to the real implementations.
struct NegotiationOptions {
  ChannelFactory          channel_factory;
  StubberLookup           stubber_lookup;
  MachineConfigLoader     config_loader;
  machine::PlatformFamily platform          = machine::HostPlatformFamily();
  bool                    wait_for_connected = true;
};

/*
  Maps a connection URI to a gRPC target. unix:// and tcp:// are
  accepted; anything else (npipe:// included on this platform) is
  util::TransportFailure.
*/
std::string ResolveTarget(const std::string& uri);

std::shared_ptr<::grpc::ChannelCredentials> BuildChannelCredentials(const engine::TlsMaterial& tls);

// First line of the identity file, trimmed. Empty path means no identity.
std::string ReadIdentityToken(const std::string& identity_path);

/*
  Turns a descriptor into a live context.

  For a machine-mediated descriptor the machine must be running before
  any channel is created; its address is derived fresh from the machine
  config on every call. Every failure surfaces as util::TransportFailure.
*/
std::shared_ptr<ClientContext> NegotiateConnection(const engine::ConnectionDescriptor& descriptor,
                                                   const NegotiationOptions&           options = {});

} // namespace berth::remote
