#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <google/protobuf/util/message_differencer.h>

#include "internal/direct/direct_engine.hpp"
#include "internal/engine/event_subscription.hpp"
#include "internal/grpc/engine_server.hpp"
#include "internal/remote/connection.hpp"
#include "internal/remote/remote_engine.hpp"
#include "internal/runtime/local_runtime.hpp"
#include "internal/runtime/server.hpp"
#include "internal/storage/memory/memory_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace berth::engine::v1;
using berth::storage::model::ContainerRecord;
using berth::storage::model::ContainerState;
using berth::storage::model::ImageRecord;

constexpr char kIdentity[] = "parity-token";

class RecordingRegistry final : public berth::runtime::RegistryClient {
 public:
  std::map<std::string, std::string> digests;
  std::optional<berth::auth::Credentials> last_credentials;

  std::string ResolveDigest(const berth::runtime::ImageReference& reference, const berth::auth::RegistryCredentials& credentials) override {
    last_credentials = credentials.For(reference.registry);
    auto it = digests.find(reference.String());
    if (it == digests.end()) {
      throw berth::util::NotFound(reference.String() + ": manifest unknown");
    }
    return it->second;
  }
};

std::filesystem::path TempDir() {
  auto dir = std::filesystem::temp_directory_path() /
             ("berth-parity-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  std::filesystem::create_directories(dir);
  return dir;
}

void WriteFile(const std::filesystem::path& path, const std::string& contents) {
  std::ofstream out(path);
  out << contents;
}

/*
  One direct engine served in-process over EngineService, plus a remote
  engine negotiated against it. Both views share the same store.
*/
struct Harness {
  std::filesystem::path dir = TempDir();
  std::shared_ptr<berth::storage::memory::MemoryStore> store = std::make_shared<berth::storage::memory::MemoryStore>();
  std::shared_ptr<RecordingRegistry> registry = std::make_shared<RecordingRegistry>();
  std::shared_ptr<berth::runtime::LocalRuntime> runtime;
  std::shared_ptr<berth::engine::Engine> direct;
  std::unique_ptr<berth::runtime::Server> server;
  std::shared_ptr<berth::engine::Engine> remote;

  Harness() {
    runtime = std::make_shared<berth::runtime::LocalRuntime>(store, registry);
    direct  = std::make_shared<berth::direct::DirectEngine>(berth::direct::RuntimeHandle{runtime, store});

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<berth::grpc::EngineServer>(direct, kIdentity));
    server = std::make_unique<berth::runtime::Server>(berth::runtime::ServerOptions{"127.0.0.1:0", "", "", ""}, std::move(services));
    server->Start();
    assert(server->Port() > 0);

    WriteFile(dir / "identity", std::string(kIdentity) + "\n");
    remote = Connect(dir / "identity");
  }

  ~Harness() {
    remote->Shutdown();
    server->Stop(std::chrono::milliseconds(200));
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }

  std::string Uri() const {
    return "tcp://127.0.0.1:" + std::to_string(server->Port());
  }

  std::shared_ptr<berth::engine::Engine> Connect(const std::filesystem::path& identity) const {
    berth::engine::ConnectionDescriptor descriptor(Uri(), identity.string(), {}, std::nullopt, std::chrono::milliseconds(2000));
    return std::make_shared<berth::remote::RemoteEngine>(berth::remote::NegotiateConnection(descriptor));
  }

  void AddContainer(const std::string& id, const std::string& name, ContainerState state, const std::string& healthcheck,
                    const std::string& health) {
    ContainerRecord c;
    c.id                  = id;
    c.name                = name;
    c.state               = state;
    c.healthcheck_command = healthcheck;
    c.health_status       = health;
    auto tx = store->Begin();
    assert(store->InsertContainer(*tx, c));
    tx->Commit();
  }

  void AddImage(const std::string& id, std::vector<std::string> names, const std::string& digest) {
    ImageRecord image;
    image.id     = id;
    image.names  = std::move(names);
    image.digest = digest;
    auto tx = store->Begin();
    assert(store->InsertImage(*tx, image));
    tx->Commit();
  }
};

// What a call ended with, in a shape both backends can be compared on.
struct Outcome {
  std::optional<ErrorKind> kind;
  std::string              message;
  std::string              result;

  bool operator==(const Outcome&) const = default;
};

template <typename Fn>
Outcome Capture(Fn&& fn) {
  Outcome outcome;
  try {
    outcome.result = fn();
  } catch (const std::exception& e) {
    outcome.kind    = berth::util::Classify(e);
    outcome.message = e.what();
  }
  return outcome;
}

void TestHealthCheckParity(Harness& h) {
  h.AddContainer("aaa111", "web", ContainerState::kRunning, "curl -f localhost", "healthy");
  h.AddContainer("ddd444", "job", ContainerState::kExited, "true", "healthy");
  h.AddContainer("eee555", "plain", ContainerState::kRunning, "", "");

  for (const std::string name : {"web", "aaa", "ghost", "job", "plain"}) {
    const auto direct = Capture([&] { return h.direct->HealthCheckRun(name, {}).status(); });
    const auto remote = Capture([&] { return h.remote->HealthCheckRun(name, {}).status(); });
    assert(direct == remote);
  }

  const auto missing = Capture([&] { return h.remote->HealthCheckRun("ghost", {}).status(); });
  assert(missing.kind == ERROR_KIND_NOT_FOUND);
  assert(missing.message == "no container with name or ID \"ghost\" found: no such container");
  assert(Capture([&] { return h.remote->HealthCheckRun("job", {}).status(); }).kind == ERROR_KIND_CONFLICT);
}

void TestImageParity(Harness& h) {
  h.AddImage("abc123", {"docker.io/library/alpine:latest", "quay.io/acme/alpine:3"}, "sha256:abc123");

  const std::vector<std::string> names{"alpine", "missing:1", "abc"};
  const auto direct = h.direct->ImageInspect(names);
  const auto remote = h.remote->ImageInspect(names);
  assert(google::protobuf::util::MessageDifferencer::Equals(direct, remote));
  assert(remote.images_size() == 2);
  assert(remote.errors_size() == 1);
  assert(remote.errors(0).kind() == ERROR_KIND_NOT_FOUND);

  const auto untag = Capture([&] {
    h.remote->ImageUntag("abc123", {"alpine:edge"});
    return std::string();
  });
  assert(untag.kind == ERROR_KIND_NOT_FOUND);
  assert(untag.message == "alpine:edge: tag not known");

  h.remote->ImageUntag("abc123", {"alpine"});
  const auto after = h.direct->ImageInspect({"abc123"});
  assert(after.images(0).names_size() == 1);
  assert(after.images(0).names(0) == "quay.io/acme/alpine:3");
}

void TestInfoParity(Harness& h) {
  const auto direct = h.direct->Info();
  const auto remote = h.remote->Info();
  assert(remote.store().backend() == "memory");
  assert(remote.store().containers() == direct.store().containers());
  assert(remote.version().version() == direct.version().version());
  assert(h.remote->Mode() == berth::engine::EngineMode::kRemote);
}

void TestArtifactCredentialsCrossTheWire(Harness& h) {
  h.registry->digests["quay.io/acme/model:v1"] = "sha256:feed";

  ArtifactPullOptions explicit_options;
  explicit_options.set_username("alice");
  explicit_options.set_password("s3cret");
  assert(h.remote->ArtifactPull("quay.io/acme/model:v1", explicit_options).artifact_digest() == "sha256:feed");
  assert(h.registry->last_credentials.has_value());
  assert(h.registry->last_credentials->username == "alice");
  assert(h.registry->last_credentials->password == "s3cret");

  // base64("bob:hunter2")
  const auto authfile = h.dir / "auth.json";
  WriteFile(authfile, R"({"auths":{"quay.io":{"auth":"Ym9iOmh1bnRlcjI="}}})");
  ArtifactPullOptions file_options;
  file_options.set_authfile(authfile.string());
  h.registry->last_credentials.reset();
  (void)h.remote->ArtifactPull("quay.io/acme/model:v1", file_options);
  assert(h.registry->last_credentials.has_value());
  assert(h.registry->last_credentials->username == "bob");
  assert(h.registry->last_credentials->password == "hunter2");

  h.registry->last_credentials.reset();
  (void)h.remote->ArtifactPull("quay.io/acme/model:v1", {});
  assert(!h.registry->last_credentials.has_value());

  const auto missing = Capture([&] { return h.remote->ArtifactPull("quay.io/acme/model:v2", {}).artifact_digest(); });
  assert(missing.kind == ERROR_KIND_NOT_FOUND);
}

void TestUnsupportedOperationsStayLocal(Harness& h) {
  const auto update = h.remote->AutoUpdate({});
  assert(update.errors_size() == 1);
  assert(update.errors(0).kind() == ERROR_KIND_UNSUPPORTED);

  assert(Capture([&] { return h.remote->ShowTrust({}).raw(); }).kind == ERROR_KIND_UNSUPPORTED);
  assert(Capture([&] {
           h.remote->SetTrust("docker.io", {});
           return std::string();
         }).kind == ERROR_KIND_UNSUPPORTED);
}

void TestIdentityIsChecked(Harness& h) {
  WriteFile(h.dir / "wrong", "someone-else\n");
  auto intruder = h.Connect(h.dir / "wrong");

  const auto outcome = Capture([&] { return intruder->Info().host().os(); });
  assert(outcome.kind == ERROR_KIND_TRANSPORT_FAILURE);
  intruder->Shutdown();
}

void TestEventStreamCancelAndClose(Harness& h) {
  EventsOptions options;
  options.set_stream(true);
  options.add_filter("event=health_status");

  std::atomic<int> seen{0};
  {
    berth::engine::EventSubscription subscription(*h.remote, options, [&](const Event& e) {
      assert(e.health_status() == "healthy");
      seen.fetch_add(1);
    });
    while (seen.load() == 0) {
      (void)h.direct->HealthCheckRun("web", {});
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    subscription.Stop();
    // A caller-requested stop is a normal end of stream.
    subscription.Wait();
  }

  berth::engine::EventSubscription closed(*h.remote, options, [](const Event&) {});
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  h.runtime->CloseEvents();

  bool stream_closed = false;
  try {
    closed.Wait();
  } catch (const berth::util::StreamClosed&) {
    stream_closed = true;
  }
  assert(stream_closed);
}

void TestShutdownAndServerLoss(Harness& h) {
  auto second = h.Connect(h.dir / "identity");
  (void)second->Info();
  second->Shutdown();
  assert(Capture([&] { return second->Info().host().os(); }).kind == ERROR_KIND_TRANSPORT_FAILURE);

  // The shared server is unaffected by one client closing.
  (void)h.remote->Info();

  h.server->Stop(std::chrono::milliseconds(200));
  assert(Capture([&] { return h.remote->Info().host().os(); }).kind == ERROR_KIND_TRANSPORT_FAILURE);
}

} // namespace

int main() {
  Harness h;

  TestHealthCheckParity(h);
  TestImageParity(h);
  TestInfoParity(h);
  TestArtifactCredentialsCrossTheWire(h);
  TestUnsupportedOperationsStayLocal(h);
  TestIdentityIsChecked(h);
  TestEventStreamCancelAndClose(h);
  TestShutdownAndServerLoss(h);

  std::cout << "berth_integration_backend_parity: pass\n";
  return 0;
}
