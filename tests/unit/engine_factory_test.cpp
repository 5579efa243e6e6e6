#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/engine/capability_table.hpp"
#include "internal/engine/connection_descriptor.hpp"
#include "internal/engine/engine_mode.hpp"
#include "internal/factory.hpp"
#include "internal/remote/connection.hpp"
#include "internal/remote/protocol.hpp"
#include "internal/remote/remote_engine.hpp"
#include "internal/util/errors.hpp"

namespace {

using berth::engine::CapabilityTable;
using berth::engine::ConnectionDescriptor;
using berth::engine::Operation;
using berth::machine::VmStatus;
using namespace berth::engine::v1;

template <typename Error, typename Fn>
std::string ExpectThrow(Fn&& fn) {
  try {
    fn();
  } catch (const Error& e) {
    return e.what();
  }
  assert(false && "expected exception");
  return {};
}

class FakeStubber final : public berth::machine::VmStubber {
 public:
  explicit FakeStubber(VmStatus status) : status_(status) {
  }

  std::string Provider() const override {
    return "fake";
  }
  berth::machine::StateReport State(const berth::machine::v1::MachineConfig&) override {
    return {status_, {"probed"}};
  }
  berth::machine::StopReport StopVM(const berth::machine::v1::MachineConfig&, bool) override {
    return {};
  }
  berth::machine::RemoveReport Remove(const berth::machine::v1::MachineConfig&) override {
    return {};
  }

 private:
  VmStatus status_;
};

berth::config::EngineConfig MachineConfig() {
  berth::config::EngineConfig config;
  config.set_mode(berth::config::ENGINE_MODE_REMOTE);
  config.mutable_remote()->set_machine(true);
  config.mutable_machine()->set_name("dev");
  config.mutable_machine()->set_provider("fake");
  config.mutable_machine()->set_config_dir("/nonexistent/machines");
  return config;
}

berth::remote::NegotiationOptions MachineOptions(VmStatus status, int* channels_created) {
  berth::remote::NegotiationOptions options;
  options.platform       = berth::machine::PlatformFamily::kUnix;
  options.config_loader  = [](const std::filesystem::path&, const std::string& name) {
    berth::machine::v1::MachineConfig cfg;
    cfg.set_name(name);
    cfg.mutable_api_socket()->set_path("/nonexistent/" + name + "-api.sock");
    return cfg;
  };
  options.stubber_lookup  = [status](const std::string&) { return std::make_unique<FakeStubber>(status); };
  options.channel_factory = [channels_created](const std::string& target, const std::shared_ptr<::grpc::ChannelCredentials>& creds) {
    ++*channels_created;
    return ::grpc::CreateChannel(target, creds);
  };
  options.wait_for_connected = false;
  return options;
}

void TestUnsupportedModeFailsBeforeBackendCreation() {
  berth::config::EngineConfig config;
  const auto message = ExpectThrow<berth::util::Unsupported>([&] { berth::factory::NewEngine(config); });
  assert(message == "runtime mode 'ENGINE_MODE_UNSPECIFIED' is not supported");

  const auto bogus = ExpectThrow<berth::util::Unsupported>(
      [] { berth::engine::ResolveEngineMode(static_cast<berth::config::EngineMode>(42)); });
  assert(bogus == "runtime mode '42' is not supported");

  assert(berth::engine::ResolveEngineMode(berth::config::ENGINE_MODE_DIRECT) == berth::engine::EngineMode::kDirect);
  assert(berth::engine::ResolveEngineMode(berth::config::ENGINE_MODE_REMOTE) == berth::engine::EngineMode::kRemote);
}

void TestDirectFactoryBindsDirectBackend() {
  berth::config::EngineConfig config;
  config.set_mode(berth::config::ENGINE_MODE_DIRECT);
  config.mutable_direct()->mutable_storage()->mutable_memory();

  auto engine = berth::factory::NewEngine(config);
  assert(engine->Mode() == berth::engine::EngineMode::kDirect);
  assert(engine->Info().store().backend() == "memory");
  engine->Shutdown();
}

void TestDescriptorFromConfig() {
  berth::config::EngineConfig config;
  config.set_mode(berth::config::ENGINE_MODE_REMOTE);
  ExpectThrow<berth::util::Internal>([&] { ConnectionDescriptor::FromConfig(config); });

  config.mutable_remote()->set_uri("unix:///run/berth/berth.sock");
  auto plain = ConnectionDescriptor::FromConfig(config);
  assert(!plain.MachineMediated());
  assert(plain.ConnectTimeout() == ConnectionDescriptor::kDefaultConnectTimeout);
  assert(plain.Tls().Empty());

  config.mutable_remote()->set_connect_timeout_ms(250);
  assert(ConnectionDescriptor::FromConfig(config).ConnectTimeout().count() == 250);

  auto machine_cfg = MachineConfig();
  machine_cfg.mutable_machine()->clear_name();
  ExpectThrow<berth::util::Internal>([&] { ConnectionDescriptor::FromConfig(machine_cfg); });

  auto mediated = ConnectionDescriptor::FromConfig(MachineConfig());
  assert(mediated.MachineMediated());
  assert(mediated.Uri().empty());
  assert(mediated.Machine()->name == "dev");
  assert(mediated.Machine()->config_dir == "/nonexistent/machines");
}

void TestResolveTarget() {
  assert(berth::remote::ResolveTarget("unix:///run/berth/berth.sock") == "unix:/run/berth/berth.sock");
  assert(berth::remote::ResolveTarget("tcp://10.0.0.5:8080") == "10.0.0.5:8080");

  const auto pipe = ExpectThrow<berth::util::TransportFailure>([] { berth::remote::ResolveTarget("npipe:////./pipe/berth-dev"); });
  assert(pipe == "unsupported connection scheme \"npipe\"");
  ExpectThrow<berth::util::TransportFailure>([] { berth::remote::ResolveTarget("localhost:8080"); });
  ExpectThrow<berth::util::TransportFailure>([] { berth::remote::ResolveTarget("unix://"); });
}

void TestTlsMaterialMustBePaired() {
  berth::engine::TlsMaterial tls{"/etc/berth/client.pem", "", ""};
  ExpectThrow<berth::util::TransportFailure>([&] { berth::remote::BuildChannelCredentials(tls); });
}

void TestStoppedMachineCreatesNoChannel() {
  int  channels   = 0;
  auto descriptor = ConnectionDescriptor::FromConfig(MachineConfig());

  const auto message = ExpectThrow<berth::util::TransportFailure>(
      [&] { berth::remote::NegotiateConnection(descriptor, MachineOptions(VmStatus::kStopped, &channels)); });
  assert(message == "machine dev is not running");
  assert(channels == 0);

  ExpectThrow<berth::util::TransportFailure>(
      [&] { berth::remote::NegotiateConnection(descriptor, MachineOptions(VmStatus::kStarting, &channels)); });
  assert(channels == 0);
}

void TestMachineLoaderErrorsAreTransportFailures() {
  int  channels   = 0;
  auto options    = MachineOptions(VmStatus::kRunning, &channels);
  options.config_loader = [](const std::filesystem::path&, const std::string&) -> berth::machine::v1::MachineConfig {
    throw berth::util::NotFound("machine config dev.json not found");
  };
  auto descriptor = ConnectionDescriptor::FromConfig(MachineConfig());

  const auto message =
      ExpectThrow<berth::util::TransportFailure>([&] { berth::remote::NegotiateConnection(descriptor, options); });
  assert(message.find("machine dev") == 0);
  assert(channels == 0);
}

void TestRunningMachineUsesItsSocket() {
  int  channels   = 0;
  auto descriptor = ConnectionDescriptor::FromConfig(MachineConfig());

  auto context = berth::remote::NegotiateConnection(descriptor, MachineOptions(VmStatus::kRunning, &channels));
  assert(channels == 1);
  assert(context->Target() == "unix:///nonexistent/dev-api.sock");
  context->Close();
  assert(context->Closed());
}

void TestUnreachableEndpointTimesOut() {
  berth::config::EngineConfig config;
  config.set_mode(berth::config::ENGINE_MODE_REMOTE);
  config.mutable_remote()->set_uri("unix:///nonexistent/berth.sock");
  config.mutable_remote()->set_connect_timeout_ms(200);

  const auto message = ExpectThrow<berth::util::TransportFailure>([&] { berth::factory::NewEngine(config); });
  assert(message.find("cannot connect to unix:///nonexistent/berth.sock") == 0);
}

void TestCapabilityTable() {
  CapabilityTable all;
  assert(all.Supports(Operation::kShowTrust));
  all.Require(Operation::kSetTrust);

  auto remote = CapabilityTable::RemoteProtocol();
  assert(!remote.Supports(Operation::kAutoUpdate));
  assert(!remote.Supports(Operation::kShowTrust));
  assert(!remote.Supports(Operation::kSetTrust));
  assert(remote.Supports(Operation::kEvents));
  assert(*remote.UnsupportedReason(Operation::kShowTrust) == CapabilityTable::kNotImplemented);

  remote.Declare(Operation::kShowTrust, true).Declare(Operation::kInfo, false, "info disabled");
  assert(remote.Supports(Operation::kShowTrust));
  assert(ExpectThrow<berth::util::Unsupported>([&] { remote.Require(Operation::kInfo); }) == "info disabled");
}

void TestUnsupportedRemoteOperationsNeverTouchTheWire() {
  auto channel = ::grpc::CreateChannel("unix:/nonexistent/berth.sock", ::grpc::InsecureChannelCredentials());
  auto context = std::make_shared<berth::remote::ClientContext>(channel, "unix:///nonexistent/berth.sock", "");
  berth::remote::RemoteEngine engine(context);
  assert(engine.Mode() == berth::engine::EngineMode::kRemote);

  const auto update = engine.AutoUpdate(AutoUpdateOptions{});
  assert(update.reports_size() == 0);
  assert(update.errors_size() == 1);
  assert(update.errors(0).kind() == ERROR_KIND_UNSUPPORTED);
  assert(update.errors(0).message() == "not implemented");

  assert(ExpectThrow<berth::util::Unsupported>([&] { engine.ShowTrust(ShowTrustOptions{}); }) == "not implemented");
  ExpectThrow<berth::util::Unsupported>([&] { engine.SetTrust("docker.io", SetTrustOptions{}); });

  // A lazily created channel only leaves IDLE once a call is attempted.
  assert(channel->GetState(false) == GRPC_CHANNEL_IDLE);
}

void TestRemoteRejectsSupportWithoutProcedure() {
  auto channel = ::grpc::CreateChannel("unix:/nonexistent/berth.sock", ::grpc::InsecureChannelCredentials());
  auto context = std::make_shared<berth::remote::ClientContext>(channel, "unix:///nonexistent/berth.sock", "");

  for (const auto op : {Operation::kAutoUpdate, Operation::kShowTrust, Operation::kSetTrust}) {
    auto table         = CapabilityTable::RemoteProtocol().Declare(op, true);
    const auto message = ExpectThrow<berth::util::Internal>([&] { berth::remote::RemoteEngine engine(context, table); });
    assert(message == std::string(berth::engine::OperationName(op)) + " has no remote procedure and cannot be declared supported");
  }

  // A declared reason is what the caller sees.
  auto table = CapabilityTable::RemoteProtocol()
                   .Declare(Operation::kShowTrust, false, "trust is managed on the host")
                   .Declare(Operation::kAutoUpdate, false, "run auto-update on the host");
  berth::remote::RemoteEngine engine(context, table);
  assert(ExpectThrow<berth::util::Unsupported>([&] { engine.ShowTrust(ShowTrustOptions{}); }) == "trust is managed on the host");
  assert(engine.AutoUpdate(AutoUpdateOptions{}).errors(0).message() == "run auto-update on the host");
  assert(channel->GetState(false) == GRPC_CHANNEL_IDLE);
}

void TestClosedConnectionFailsCalls() {
  auto channel = ::grpc::CreateChannel("unix:/nonexistent/berth.sock", ::grpc::InsecureChannelCredentials());
  auto context = std::make_shared<berth::remote::ClientContext>(channel, "unix:///nonexistent/berth.sock", "");
  berth::remote::RemoteEngine engine(context);

  engine.Shutdown();
  const auto message = ExpectThrow<berth::util::TransportFailure>([&] { engine.Info(); });
  assert(message == "connection to unix:///nonexistent/berth.sock is closed");
  assert(channel->GetState(false) == GRPC_CHANNEL_IDLE);
}

void TestParamsOmitUnsetOptionals() {
  ArtifactPullOptions options;
  options.set_retry(3);
  options.set_tls_verify(false);

  const auto params = berth::remote::ToParams(options);
  assert(params.size() == 2);
  assert(params[0] == std::make_pair(std::string("tls_verify"), std::string("false")));
  assert(params[1] == std::make_pair(std::string("retry"), std::string("3")));

  EventsOptions events;
  events.add_filter("type=container");
  events.add_filter("event=start");
  const auto event_params = berth::remote::ToParams(events);
  assert(event_params.size() == 2);
  assert(event_params[0].first == "filter" && event_params[1].second == "event=start");
  assert(berth::remote::DescribeParams(event_params) == "filter=type=container filter=event=start");

  HealthCheckRequest request;
  request.set_name_or_id("web");
  request.mutable_options();
  assert(berth::remote::ToParams(request).size() == 1);
}

void TestArtifactPullMovesCredentialsToHeaders() {
  ArtifactPullOptions options;
  options.set_username("alice");
  options.set_password("s3cret");
  options.set_quiet(true);

  berth::auth::Headers headers;
  const auto request = berth::remote::EncodeArtifactPull("quay.io/acme/model:v1", options, &headers);
  assert(request.name() == "quay.io/acme/model:v1");
  assert(!request.options().has_username());
  assert(!request.options().has_password());
  assert(!request.options().has_authfile());
  assert(request.options().quiet());
  assert(headers.size() == 1);
  assert(headers[0].first == berth::auth::kRegistryAuthHeader);

  berth::auth::Headers none;
  berth::remote::EncodeArtifactPull("quay.io/acme/model:v1", ArtifactPullOptions{}, &none);
  assert(none.empty());
}

} // namespace

int main() {
  TestUnsupportedModeFailsBeforeBackendCreation();
  TestDirectFactoryBindsDirectBackend();
  TestDescriptorFromConfig();
  TestResolveTarget();
  TestTlsMaterialMustBePaired();
  TestStoppedMachineCreatesNoChannel();
  TestMachineLoaderErrorsAreTransportFailures();
  TestRunningMachineUsesItsSocket();
  TestUnreachableEndpointTimesOut();
  TestCapabilityTable();
  TestUnsupportedRemoteOperationsNeverTouchTheWire();
  TestRemoteRejectsSupportWithoutProcedure();
  TestClosedConnectionFailsCalls();
  TestParamsOmitUnsetOptionals();
  TestArtifactPullMovesCredentialsToHeaders();

  std::cout << "berth_unit_engine_factory: pass\n";
  return 0;
}
