#include "registry_auth.hpp"

#include <absl/strings/escaping.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace berth::auth {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

Struct ParseJson(const std::string& json, const std::string& what) {
  Struct                                    out;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  const auto status            = google::protobuf::util::JsonStringToMessage(json, &out, options);
  if (!status.ok()) {
    throw util::Internal("parse " + what + ": " + std::string(status.message()));
  }
  return out;
}

std::string ToJson(const Struct& message) {
  std::string out;
  const auto  status = google::protobuf::util::MessageToJsonString(message, &out);
  if (!status.ok()) {
    throw util::Internal("encode registry credentials: " + std::string(status.message()));
  }
  return out;
}

std::string StringField(const Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.kind_case() != Value::kStringValue) {
    return {};
  }
  return it->second.string_value();
}

Struct CredentialsObject(const Credentials& credentials) {
  Struct object;
  (*object.mutable_fields())["username"].set_string_value(credentials.username);
  (*object.mutable_fields())["password"].set_string_value(credentials.password);
  return object;
}

Credentials FromObject(const Struct& object) {
  return Credentials{StringField(object, "username"), StringField(object, "password")};
}

std::string DecodeHeader(const std::string& value, const char* header) {
  std::string decoded;
  if (!absl::WebSafeBase64Unescape(value, &decoded) && !absl::Base64Unescape(value, &decoded)) {
    throw util::Internal(std::string("malformed ") + header + " header");
  }
  return decoded;
}

} // namespace

std::optional<Credentials> RegistryCredentials::For(const std::string& registry) const {
  if (explicit_credentials) {
    return explicit_credentials;
  }
  auto it = per_registry.find(registry);
  if (it == per_registry.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::map<std::string, Credentials> LoadAuthFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw util::Internal("credentials cannot be resolved: unable to read auth file " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  const Struct root = ParseJson(buffer.str(), "auth file " + path);

  std::map<std::string, Credentials> out;
  auto                               auths = root.fields().find("auths");
  if (auths == root.fields().end() || auths->second.kind_case() != Value::kStructValue) {
    return out;
  }

  for (const auto& [registry, entry] : auths->second.struct_value().fields()) {
    if (entry.kind_case() != Value::kStructValue) {
      continue;
    }
    const auto encoded = StringField(entry.struct_value(), "auth");
    if (encoded.empty()) {
      continue;
    }
    std::string decoded;
    if (!absl::Base64Unescape(encoded, &decoded)) {
      throw util::Internal("auth file " + path + ": invalid auth entry for " + registry);
    }
    const auto colon = decoded.find(':');
    if (colon == std::string::npos) {
      throw util::Internal("auth file " + path + ": invalid auth entry for " + registry);
    }
    out[registry] = Credentials{decoded.substr(0, colon), decoded.substr(colon + 1)};
  }
  return out;
}

RegistryCredentials ResolveCredentials(const SystemContext& context, const std::string& username, const std::string& password) {
  RegistryCredentials out;
  if (!username.empty()) {
    out.explicit_credentials = Credentials{username, password};
    return out;
  }
  if (!context.authfile_path.empty()) {
    out.per_registry = LoadAuthFile(context.authfile_path);
  }
  return out;
}

Headers MakeRegistryAuthHeaders(const SystemContext& context, const std::string& username, const std::string& password) {
  Headers headers;

  if (!username.empty()) {
    const auto json = ToJson(CredentialsObject(Credentials{username, password}));
    headers.emplace_back(kRegistryAuthHeader, absl::WebSafeBase64Escape(json));
    return headers;
  }

  if (context.authfile_path.empty()) {
    return headers;
  }

  Struct config;
  for (const auto& [registry, credentials] : LoadAuthFile(context.authfile_path)) {
    *(*config.mutable_fields())[registry].mutable_struct_value() = CredentialsObject(credentials);
  }
  headers.emplace_back(kRegistryConfigHeader, absl::WebSafeBase64Escape(ToJson(config)));
  return headers;
}

RegistryCredentials DecodeRegistryAuthHeaders(const std::string& auth_value, const std::string& config_value) {
  RegistryCredentials out;

  if (!auth_value.empty()) {
    out.explicit_credentials = FromObject(ParseJson(DecodeHeader(auth_value, kRegistryAuthHeader), kRegistryAuthHeader));
  }

  if (!config_value.empty()) {
    const Struct config = ParseJson(DecodeHeader(config_value, kRegistryConfigHeader), kRegistryConfigHeader);
    for (const auto& [registry, entry] : config.fields()) {
      if (entry.kind_case() == Value::kStructValue) {
        out.per_registry[registry] = FromObject(entry.struct_value());
      }
    }
  }
  return out;
}

TemporaryAuthFile::TemporaryAuthFile(const std::map<std::string, Credentials>& per_registry) {
  Struct root;
  auto&  auths = *(*root.mutable_fields())["auths"].mutable_struct_value();
  for (const auto& [registry, credentials] : per_registry) {
    auto& entry = *(*auths.mutable_fields())[registry].mutable_struct_value();
    (*entry.mutable_fields())["auth"].set_string_value(absl::Base64Escape(credentials.username + ":" + credentials.password));
  }
  const auto json = ToJson(root);

  auto              pattern = (std::filesystem::temp_directory_path() / "berth-auth-XXXXXX").string();
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');

  const int fd = ::mkstemp(buffer.data());
  if (fd < 0) {
    throw util::Internal(std::string("create temporary auth file: ") + std::strerror(errno));
  }
  path_ = buffer.data();

  std::size_t written = 0;
  while (written < json.size()) {
    const auto n = ::write(fd, json.data() + written, json.size() - written);
    if (n < 0) {
      const int err = errno;
      ::close(fd);
      std::error_code ec;
      std::filesystem::remove(path_, ec);
      throw util::Internal("write temporary auth file " + path_ + ": " + std::strerror(err));
    }
    written += static_cast<std::size_t>(n);
  }
  ::close(fd);
}

TemporaryAuthFile::~TemporaryAuthFile() {
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    BERTH_LOG_WARN("failed to remove temporary auth file",
                   {observability::StringField("path", path_), observability::StringField("error", ec.message())});
  }
}

} // namespace berth::auth
