#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace berth::auth {

inline constexpr char kRegistryAuthHeader[]   = "x-registry-auth";
inline constexpr char kRegistryConfigHeader[] = "x-registry-config";

// Client side system context; only the auth file location is consulted.
struct SystemContext {
  std::string authfile_path;
};

struct Credentials {
  std::string username;
  std::string password;
};

/*
  Credentials resolved for one registry-touching call.

  Explicit username/password apply to every registry; otherwise the
  per registry entries (from an auth file) are consulted.
*/
struct RegistryCredentials {
  std::optional<Credentials>         explicit_credentials;
  std::map<std::string, Credentials> per_registry;

  std::optional<Credentials> For(const std::string& registry) const;

  bool Empty() const {
    return !explicit_credentials && per_registry.empty();
  }
};

using Headers = std::vector<std::pair<std::string, std::string>>;

/*
  Parses a containers auth file:

    {"auths": {"quay.io": {"auth": "<base64 user:password>"}}}

  Throws util::Internal if the file cannot be read or parsed.
*/
std::map<std::string, Credentials> LoadAuthFile(const std::string& path);

// Direct call site: username/password win over the auth file.
RegistryCredentials ResolveCredentials(const SystemContext& context, const std::string& username, const std::string& password);

/*
  Remote call site. Username/password travel as x-registry-auth, an auth
  file as x-registry-config (base64url JSON map registry -> credentials).
  No credentials yield no headers. Throws util::Internal if the auth file
  cannot be resolved.
*/
Headers MakeRegistryAuthHeaders(const SystemContext& context, const std::string& username, const std::string& password);

// Server side inverse of MakeRegistryAuthHeaders. Empty values are absent.
RegistryCredentials DecodeRegistryAuthHeaders(const std::string& auth_value, const std::string& config_value);

/*
  Auth file holding per registry credentials received from a client,
  written with mode 0600 and removed on destruction. Lets the server
  hand x-registry-config credentials to code that reads auth files.
*/
class TemporaryAuthFile {
 public:
  explicit TemporaryAuthFile(const std::map<std::string, Credentials>& per_registry);
  ~TemporaryAuthFile();

  TemporaryAuthFile(const TemporaryAuthFile&)            = delete;
  TemporaryAuthFile& operator=(const TemporaryAuthFile&) = delete;

  const std::string& Path() const {
    return path_;
  }

 private:
  std::string path_;
};

} // namespace berth::auth
