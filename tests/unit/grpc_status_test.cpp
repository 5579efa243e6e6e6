#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/direct/direct_engine.hpp"
#include "internal/grpc/engine_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/remote/protocol.hpp"
#include "internal/runtime/local_runtime.hpp"
#include "internal/storage/memory/memory_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace berth::engine::v1;
using berth::storage::model::ContainerRecord;
using berth::storage::model::ContainerState;

std::shared_ptr<berth::engine::Engine> BuildEngine() {
  auto store   = std::make_shared<berth::storage::memory::MemoryStore>();
  auto runtime = std::make_shared<berth::runtime::LocalRuntime>(store, std::make_shared<berth::runtime::DirectoryRegistry>(""));

  ContainerRecord stopped;
  stopped.id                  = "c0ffee";
  stopped.name                = "job";
  stopped.state               = ContainerState::kExited;
  stopped.healthcheck_command = "true";
  auto tx = store->Begin();
  assert(store->InsertContainer(*tx, stopped));
  tx->Commit();

  return std::make_shared<berth::direct::DirectEngine>(berth::direct::RuntimeHandle{runtime, store});
}

void TestHealthCheckMissingContainerReturnsNotFound() {
  berth::grpc::EngineServer server(BuildEngine());

  HealthCheckRequest req;
  req.set_name_or_id("ghost");
  HealthCheckResults    resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.HealthCheckRun(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(status.error_message() == "no container with name or ID \"ghost\" found: no such container");
}

void TestHealthCheckStoppedContainerReturnsFailedPrecondition() {
  berth::grpc::EngineServer server(BuildEngine());

  HealthCheckRequest req;
  req.set_name_or_id("job");
  HealthCheckResults    resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.HealthCheckRun(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestArtifactPullWithoutMirrorReturnsUnimplemented() {
  berth::grpc::EngineServer server(BuildEngine());

  ArtifactPullRequest req;
  req.set_name("quay.io/acme/model:v1");
  ArtifactPullReport    resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.ArtifactPull(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNIMPLEMENTED);
}

void TestMissingIdentityReturnsUnauthenticated() {
  berth::grpc::EngineServer server(BuildEngine(), "expected-token");

  InfoRequest           req;
  SystemInfo            resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.Info(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
}

template <typename Error>
void CheckRoundTrip(const Error& error, ErrorKind kind) {
  const auto status = berth::grpc::ToStatus(error);
  assert(berth::remote::KindFromStatus(status.error_code()) == kind);

  bool rethrown = false;
  try {
    berth::remote::RaiseStatus(status);
  } catch (const Error& e) {
    rethrown = std::string(e.what()) == error.what();
  }
  assert(rethrown);
}

void TestErrorKindsSurviveTheWire() {
  CheckRoundTrip(berth::util::NotFound("nf"), ERROR_KIND_NOT_FOUND);
  CheckRoundTrip(berth::util::Conflict("conflict"), ERROR_KIND_CONFLICT);
  CheckRoundTrip(berth::util::Unsupported("nope"), ERROR_KIND_UNSUPPORTED);
  CheckRoundTrip(berth::util::TransportFailure("down"), ERROR_KIND_TRANSPORT_FAILURE);
  CheckRoundTrip(berth::util::StreamClosed("closed"), ERROR_KIND_STREAM_CLOSED);
  CheckRoundTrip(berth::util::Internal("boom"), ERROR_KIND_INTERNAL);

  const std::runtime_error plain("plain");
  assert(berth::grpc::ToStatus(plain).error_code() == ::grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestHealthCheckMissingContainerReturnsNotFound();
  TestHealthCheckStoppedContainerReturnsFailedPrecondition();
  TestArtifactPullWithoutMirrorReturnsUnimplemented();
  TestMissingIdentityReturnsUnauthenticated();
  TestErrorKindsSurviveTheWire();

  std::cout << "berth_unit_grpc_status: pass\n";
  return 0;
}
