#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/engine/engine.hpp"
#include "internal/remote/connection.hpp"
#include "internal/runtime/registry_client.hpp"

namespace berth::factory {

/*
  Collaborators that may be swapped without touching config. Unset
  members use the production implementations.
*/
struct EngineDependencies {
  // Direct mode: replaces the registry mirror named in config.
  std::shared_ptr<runtime::RegistryClient> registry;
  // Remote mode: channel, stubber and machine config seams.
  remote::NegotiationOptions negotiation;
};

/*
  NewEngine

  Composition root of the facade. The mode is resolved before anything
  else is touched, so an unsupported mode creates no backend resources.
  Direct mode opens the store and builds the local runtime; remote mode
  negotiates a connection from remote.* / machine.*.
*/
std::shared_ptr<engine::Engine> NewEngine(const berth::config::EngineConfig& config, const EngineDependencies& deps = {});

/*
  Everything the daemon serves: the engine plus its gRPC adapters.
*/
struct Application {
  std::shared_ptr<engine::Engine> engine;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

Application Build(const berth::config::EngineConfig& config, const EngineDependencies& deps = {});

} // namespace berth::factory
