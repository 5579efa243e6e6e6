#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

#include "internal/runtime/trust_policy.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using berth::engine::v1::SetTrustOptions;

fs::path Workspace(const std::string& name) {
  const auto dir = fs::temp_directory_path() / ("berth_trust_" + std::to_string(::getpid())) / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void TestMissingPolicyIsNotFound() {
  const auto dir = Workspace("missing");
  bool       not_found = false;
  try {
    (void)berth::runtime::ShowTrustPolicy(dir / "policy.json", dir / "registries.d", false);
  } catch (const berth::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestShowDescribesDefaultAndScopes() {
  const auto dir = Workspace("show");
  std::ofstream(dir / "policy.json") << R"({
    "default": [{"type": "reject"}],
    "transports": {
      "docker": {
        "quay.io/acme": [{"type": "signedBy", "keyType": "GPGKeys", "keyPath": "/etc/keys/acme.gpg"}],
        "docker.io": [{"type": "insecureAcceptAnything"}]
      }
    }
  })";
  fs::create_directories(dir / "registries.d");
  std::ofstream(dir / "registries.d" / "default.yaml") << "default-docker:\n  lookaside: https://sigs.example.com\n"
                                                        << "docker:\n  quay.io/acme:\n    lookaside: https://acme.example.com/sigs\n";

  const auto report = berth::runtime::ShowTrustPolicy(dir / "policy.json", dir / "registries.d", false);
  assert(report.policies_size() == 3);

  const auto& def = report.policies(0);
  assert(def.repo_name() == "default");
  assert(def.transport() == "all");
  assert(def.type() == "reject");
  assert(def.sig_store() == "https://sigs.example.com");

  // Scopes come out sorted.
  const auto& hub = report.policies(1);
  assert(hub.repo_name() == "docker.io");
  assert(hub.type() == "accept");
  assert(hub.sig_store() == "https://sigs.example.com");

  const auto& acme = report.policies(2);
  assert(acme.repo_name() == "quay.io/acme");
  assert(acme.transport() == "docker");
  assert(acme.type() == "signed");
  assert(acme.gpg_ids_size() == 1 && acme.gpg_ids(0) == "/etc/keys/acme.gpg");
  assert(acme.sig_store() == "https://acme.example.com/sigs");

  const auto raw = berth::runtime::ShowTrustPolicy(dir / "policy.json", dir / "registries.d", true);
  assert(raw.policies_size() == 0);
  assert(raw.raw().find("quay.io/acme") != std::string::npos);
}

void TestSetCreatesAndUpdatesPolicy() {
  const auto dir    = Workspace("set");
  const auto policy = dir / "nested" / "policy.json";

  SetTrustOptions signed_by;
  signed_by.set_type("signedBy");
  signed_by.add_pubkeys_file("/etc/keys/a.gpg");
  signed_by.add_pubkeys_file("/etc/keys/b.gpg");
  berth::runtime::SetTrustPolicy(policy, "quay.io/acme", signed_by);

  SetTrustOptions reject;
  reject.set_type("reject");
  berth::runtime::SetTrustPolicy(policy, "default", reject);

  assert(!fs::exists(policy.string() + ".tmp"));

  const auto report = berth::runtime::ShowTrustPolicy(policy, dir / "none", false);
  assert(report.policies_size() == 2);
  assert(report.policies(0).repo_name() == "default");
  assert(report.policies(0).type() == "reject");
  assert(report.policies(1).repo_name() == "quay.io/acme");
  assert(report.policies(1).type() == "signed");
  assert(report.policies(1).gpg_ids_size() == 2);
}

void TestSetRejectsInvalidRequests() {
  const auto dir    = Workspace("invalid");
  const auto policy = dir / "policy.json";

  SetTrustOptions bogus;
  bogus.set_type("maybe");
  SetTrustOptions keyless;
  keyless.set_type("sigstoreSigned");

  for (const auto* options : {&bogus, &keyless}) {
    bool threw = false;
    try {
      berth::runtime::SetTrustPolicy(policy, "quay.io/acme", *options);
    } catch (const berth::util::Internal&) {
      threw = true;
    }
    assert(threw);
  }
  assert(!fs::exists(policy));
}

} // namespace

int main() {
  TestMissingPolicyIsNotFound();
  TestShowDescribesDefaultAndScopes();
  TestSetCreatesAndUpdatesPolicy();
  TestSetRejectsInvalidRequests();

  std::cout << "berth_unit_trust_policy: pass\n";
  return 0;
}
