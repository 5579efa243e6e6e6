#include "registry_client.hpp"

#include <fstream>
#include <iterator>

#include "internal/util/errors.hpp"

namespace berth::runtime {

namespace {

std::string Trim(std::string value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

std::string ReadTrimmed(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::string   content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return Trim(std::move(content));
}

bool LooksLikeRegistry(const std::string& component) {
  return component == "localhost" || component.find('.') != std::string::npos || component.find(':') != std::string::npos;
}

} // namespace

std::string ImageReference::String() const {
  auto out = registry + "/" + repository;
  if (!digest.empty()) {
    return out + "@" + digest;
  }
  return out + ":" + tag;
}

ImageReference ParseReference(const std::string& name) {
  if (name.empty()) {
    throw util::Internal("invalid reference format: empty name");
  }

  ImageReference ref;
  std::string    rest = name;

  const auto at = rest.find('@');
  if (at != std::string::npos) {
    ref.digest = rest.substr(at + 1);
    rest       = rest.substr(0, at);
    if (ref.digest.rfind("sha256:", 0) != 0) {
      throw util::Internal("invalid reference format: " + name);
    }
  }

  const auto slash = rest.find('/');
  if (slash != std::string::npos && LooksLikeRegistry(rest.substr(0, slash))) {
    ref.registry = rest.substr(0, slash);
    rest         = rest.substr(slash + 1);
  } else {
    ref.registry = "docker.io";
  }

  const auto colon = rest.rfind(':');
  if (colon != std::string::npos && rest.find('/', colon) == std::string::npos) {
    ref.tag = rest.substr(colon + 1);
    rest    = rest.substr(0, colon);
  }
  if (ref.tag.empty() && ref.digest.empty()) {
    ref.tag = "latest";
  }

  if (rest.empty()) {
    throw util::Internal("invalid reference format: " + name);
  }
  if (ref.registry == "docker.io" && rest.find('/') == std::string::npos) {
    rest = "library/" + rest;
  }
  ref.repository = rest;
  return ref;
}

std::string NormalizeReference(const std::string& name) {
  return ParseReference(name).String();
}

DirectoryRegistry::DirectoryRegistry(std::filesystem::path root) : root_(std::move(root)) {
}

void DirectoryRegistry::Authorize(const std::string& registry, const auth::RegistryCredentials& credentials) const {
  const auto secret = root_ / registry / ".credentials";
  if (!std::filesystem::exists(secret)) {
    return;
  }

  const auto presented = credentials.For(registry);
  if (!presented) {
    throw util::TransportFailure("unauthorized: authentication required for " + registry);
  }
  if (presented->username + ":" + presented->password != ReadTrimmed(secret)) {
    throw util::TransportFailure("unauthorized: invalid username/password for " + registry);
  }
}

std::string DirectoryRegistry::ResolveDigest(const ImageReference& reference, const auth::RegistryCredentials& credentials) {
  if (root_.empty()) {
    throw util::Unsupported("no registry mirror configured");
  }

  Authorize(reference.registry, credentials);

  const auto repo_dir = root_ / reference.registry / reference.repository;
  if (!std::filesystem::is_directory(repo_dir)) {
    throw util::NotFound(reference.String() + ": repository not found");
  }

  if (!reference.digest.empty()) {
    for (const auto& entry : std::filesystem::directory_iterator(repo_dir)) {
      if (entry.is_regular_file() && ReadTrimmed(entry.path()) == reference.digest) {
        return reference.digest;
      }
    }
    throw util::NotFound(reference.String() + ": manifest unknown");
  }

  const auto tag_file = repo_dir / reference.tag;
  if (!std::filesystem::is_regular_file(tag_file)) {
    throw util::NotFound(reference.String() + ": manifest unknown");
  }

  auto digest = ReadTrimmed(tag_file);
  if (digest.rfind("sha256:", 0) != 0) {
    throw util::Internal(reference.String() + ": mirror holds a malformed digest");
  }
  return digest;
}

} // namespace berth::runtime
