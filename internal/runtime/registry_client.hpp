#pragma once

#include <filesystem>
#include <string>

#include "internal/auth/registry_auth.hpp"

namespace berth::runtime {

struct ImageReference {
  std::string registry;   // docker.io
  std::string repository; // library/alpine
  std::string tag;        // latest (empty when digest is set)
  std::string digest;     // sha256:... (empty when tag is set)

  // registry/repository:tag or registry/repository@digest
  std::string String() const;
};

// Expands short names: "alpine" -> docker.io/library/alpine:latest.
ImageReference ParseReference(const std::string& name);

std::string NormalizeReference(const std::string& name);

/*
  Registry collaborator: resolves references to manifest digests.
*/
class RegistryClient {
 public:
  virtual ~RegistryClient() = default;

  /*
    Throws util::NotFound for unknown manifests, util::TransportFailure
    when the registry rejects the credentials.
  */
  virtual std::string ResolveDigest(const ImageReference& reference, const auth::RegistryCredentials& credentials) = 0;
};

/*
  Registry served from a directory mirror:

    <root>/<registry>/<repository>/<tag>    file holding the digest
    <root>/<registry>/.credentials          optional "user:password"

  A registry with a .credentials file requires matching credentials.
*/
class DirectoryRegistry final : public RegistryClient {
 public:
  explicit DirectoryRegistry(std::filesystem::path root);

  std::string ResolveDigest(const ImageReference& reference, const auth::RegistryCredentials& credentials) override;

 private:
  void Authorize(const std::string& registry, const auth::RegistryCredentials& credentials) const;

  std::filesystem::path root_;
};

} // namespace berth::runtime
