#include "factory.hpp"

#include "internal/direct/direct_engine.hpp"
#include "internal/engine/connection_descriptor.hpp"
#include "internal/engine/engine_mode.hpp"
#include "internal/grpc/engine_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/remote/remote_engine.hpp"
#include "internal/runtime/local_runtime.hpp"
#include "internal/storage/storage_factory.hpp"

namespace berth::factory {

namespace {

std::shared_ptr<engine::Engine> NewDirectEngine(const berth::config::DirectConfig& config, const EngineDependencies& deps) {
  auto store = storage::OpenStore(config.storage());

  auto registry = deps.registry;
  if (!registry) {
    registry = std::make_shared<runtime::DirectoryRegistry>(config.registry_mirror());
  }

  runtime::LocalRuntimeOptions options;
  if (!config.trust_policy_path().empty()) {
    options.trust_policy_path = config.trust_policy_path();
  }
  if (config.event_journal_size() > 0) {
    options.event_journal_size = config.event_journal_size();
  }

  auto local = std::make_shared<runtime::LocalRuntime>(store, std::move(registry), options);

  BERTH_LOG_INFO("direct engine ready", {observability::StringField("store", store->Backend()),
                                         observability::StringField("trust_policy", options.trust_policy_path.string())});

  return std::make_shared<direct::DirectEngine>(direct::RuntimeHandle{std::move(local), std::move(store)});
}

std::shared_ptr<engine::Engine> NewRemoteEngine(const berth::config::EngineConfig& config, const EngineDependencies& deps) {
  const auto descriptor = engine::ConnectionDescriptor::FromConfig(config);
  auto context = remote::NegotiateConnection(descriptor, deps.negotiation);
  return std::make_shared<remote::RemoteEngine>(std::move(context));
}

}

std::shared_ptr<engine::Engine> NewEngine(const berth::config::EngineConfig& config, const EngineDependencies& deps) {
  switch (engine::ResolveEngineMode(config.mode())) {
    case engine::EngineMode::kDirect:
      return NewDirectEngine(config.direct(), deps);
    case engine::EngineMode::kRemote:
      return NewRemoteEngine(config, deps);
  }
  return nullptr;
}

Application Build(const berth::config::EngineConfig& config, const EngineDependencies& deps) {
  Application app;
  app.engine = NewEngine(config, deps);

  const auto identity = remote::ReadIdentityToken(config.server().identity_file());
  app.grpc_services.push_back(std::make_unique<berth::grpc::EngineServer>(app.engine, identity));

  return app;
}

} // namespace berth::factory
