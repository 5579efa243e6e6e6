#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/auth/registry_auth.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using berth::auth::Credentials;
using berth::auth::SystemContext;

fs::path WriteAuthFile(const std::string& name, const std::string& contents) {
  const auto dir = fs::temp_directory_path() / "berth_registry_auth_tests";
  fs::create_directories(dir);
  const auto path = dir / name;
  std::ofstream(path) << contents;
  return path;
}

// "alice:s3cret" and "bob:hunter2" base64 encoded.
constexpr char kAuthFile[] = R"({"auths": {
  "quay.io": {"auth": "YWxpY2U6czNjcmV0"},
  "registry.example.com": {"auth": "Ym9iOmh1bnRlcjI="}
}})";

void TestLoadAuthFile() {
  const auto path  = WriteAuthFile("auth.json", kAuthFile);
  const auto auths = berth::auth::LoadAuthFile(path.string());
  assert(auths.size() == 2);
  assert(auths.at("quay.io").username == "alice");
  assert(auths.at("quay.io").password == "s3cret");
  assert(auths.at("registry.example.com").username == "bob");

  bool threw = false;
  try {
    (void)berth::auth::LoadAuthFile("/nonexistent/berth/auth.json");
  } catch (const berth::util::Internal&) {
    threw = true;
  }
  assert(threw);
}

void TestExplicitCredentialsWinOverAuthFile() {
  const auto path = WriteAuthFile("auth.json", kAuthFile);
  const auto creds = berth::auth::ResolveCredentials(SystemContext{path.string()}, "carol", "pw");
  assert(creds.explicit_credentials.has_value());
  assert(creds.per_registry.empty());
  assert(creds.For("quay.io")->username == "carol");
}

void TestNoCredentialsProduceNoHeaders() {
  const auto headers = berth::auth::MakeRegistryAuthHeaders(SystemContext{}, "", "");
  assert(headers.empty());
  assert(berth::auth::ResolveCredentials(SystemContext{}, "", "").Empty());
}

void TestUserPasswordTravelAsAuthHeader() {
  const auto headers = berth::auth::MakeRegistryAuthHeaders(SystemContext{}, "dave", "p@ss:word");
  assert(headers.size() == 1);
  assert(headers[0].first == berth::auth::kRegistryAuthHeader);
  assert(headers[0].second.find("dave") == std::string::npos);

  const auto decoded = berth::auth::DecodeRegistryAuthHeaders(headers[0].second, "");
  assert(decoded.explicit_credentials.has_value());
  assert(decoded.explicit_credentials->username == "dave");
  assert(decoded.explicit_credentials->password == "p@ss:word");
}

void TestAuthFileTravelsAsConfigHeader() {
  const auto path    = WriteAuthFile("auth.json", kAuthFile);
  const auto headers = berth::auth::MakeRegistryAuthHeaders(SystemContext{path.string()}, "", "");
  assert(headers.size() == 1);
  assert(headers[0].first == berth::auth::kRegistryConfigHeader);

  const auto decoded = berth::auth::DecodeRegistryAuthHeaders("", headers[0].second);
  assert(!decoded.explicit_credentials.has_value());
  assert(decoded.per_registry.size() == 2);
  assert(decoded.For("registry.example.com")->password == "hunter2");
  assert(!decoded.For("docker.io").has_value());
}

void TestTemporaryAuthFileIsReadableAndRemoved() {
  std::string path;
  {
    berth::auth::TemporaryAuthFile file({{"quay.io", Credentials{"alice", "s3cret"}}});
    path = file.Path();
    assert(fs::exists(path));
    const auto auths = berth::auth::LoadAuthFile(path);
    assert(auths.at("quay.io").username == "alice");
    assert(auths.at("quay.io").password == "s3cret");
  }
  assert(!fs::exists(path));
}

} // namespace

int main() {
  TestLoadAuthFile();
  TestExplicitCredentialsWinOverAuthFile();
  TestNoCredentialsProduceNoHeaders();
  TestUserPasswordTravelAsAuthHeader();
  TestAuthFileTravelsAsConfigHeader();
  TestTemporaryAuthFileIsReadableAndRemoved();

  std::cout << "berth_unit_registry_auth: pass\n";
  return 0;
}
