#include "trust_policy.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <iterator>
#include <map>
#include <system_error>

#include "internal/util/errors.hpp"

namespace berth::runtime {

namespace {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

constexpr char kDefaultPolicy[] = R"({"default":[{"type":"insecureAcceptAnything"}],"transports":{}})";

struct SigStores {
  std::string                        default_store;
  std::map<std::string, std::string> by_scope;
};

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw util::Internal("unable to read " + path.string());
  }
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

Struct ParsePolicy(const std::string& json, const std::filesystem::path& path) {
  Struct     policy;
  const auto status = google::protobuf::util::JsonStringToMessage(json, &policy);
  if (!status.ok()) {
    throw util::Internal("invalid policy in " + path.string() + ": " + std::string(status.message()));
  }
  return policy;
}

std::string LookasideOf(const YAML::Node& node) {
  if (!node || !node.IsMap()) {
    return {};
  }
  for (const char* key : {"lookaside", "sigstore"}) {
    if (node[key]) {
      return node[key].as<std::string>();
    }
  }
  return {};
}

SigStores LoadSigStores(const std::filesystem::path& registries_dir) {
  SigStores       stores;
  std::error_code ec;
  if (registries_dir.empty() || !std::filesystem::is_directory(registries_dir, ec)) {
    return stores;
  }

  for (const auto& entry : std::filesystem::directory_iterator(registries_dir)) {
    const auto ext = entry.path().extension();
    if (!entry.is_regular_file() || (ext != ".yaml" && ext != ".yml")) {
      continue;
    }
    YAML::Node root;
    try {
      root = YAML::LoadFile(entry.path().string());
    } catch (const YAML::Exception& e) {
      throw util::Internal("parse " + entry.path().string() + ": " + e.what());
    }

    const auto fallback = LookasideOf(root["default-docker"]);
    if (!fallback.empty()) {
      stores.default_store = fallback;
    }
    const auto docker = root["docker"];
    if (docker && docker.IsMap()) {
      for (const auto& item : docker) {
        stores.by_scope[item.first.as<std::string>()] = LookasideOf(item.second);
      }
    }
  }
  return stores;
}

std::string DescribeType(const std::string& type) {
  if (type == "insecureAcceptAnything") return "accept";
  if (type == "signedBy") return "signed";
  return type;
}

std::string FieldString(const Struct& object, const char* key) {
  auto it = object.fields().find(key);
  return it == object.fields().end() ? std::string{} : it->second.string_value();
}

engine::v1::TrustPolicyEntry DescribeRequirements(const std::string& repo_name, const std::string& transport,
                                                  const ListValue& requirements, const std::string& sig_store) {
  engine::v1::TrustPolicyEntry entry;
  entry.set_repo_name(repo_name);
  entry.set_transport(transport);
  entry.set_sig_store(sig_store);

  for (const auto& requirement : requirements.values()) {
    if (requirement.kind_case() != Value::kStructValue) {
      continue;
    }
    const auto& object = requirement.struct_value();
    if (entry.type().empty()) {
      entry.set_type(DescribeType(FieldString(object, "type")));
    }
    const auto key_path = FieldString(object, "keyPath");
    if (!key_path.empty()) {
      entry.add_gpg_ids(key_path);
    }
  }
  return entry;
}

ListValue BuildRequirements(const engine::v1::SetTrustOptions& options) {
  ListValue   requirements;
  const auto& type = options.type();

  auto add = [&](const std::string& policy_type, const std::string& key_path) {
    auto& object = *requirements.add_values()->mutable_struct_value()->mutable_fields();
    object["type"].set_string_value(policy_type);
    if (!key_path.empty()) {
      if (policy_type == "signedBy") {
        object["keyType"].set_string_value("GPGKeys");
      }
      object["keyPath"].set_string_value(key_path);
    }
  };

  if (type == "accept") {
    add("insecureAcceptAnything", {});
  } else if (type == "reject") {
    add("reject", {});
  } else if (type == "signedBy" || type == "sigstoreSigned") {
    if (options.pubkeys_file().empty()) {
      throw util::Internal("at least one public key must be defined for type '" + type + "'");
    }
    for (const auto& key : options.pubkeys_file()) {
      add(type, key);
    }
  } else {
    throw util::Internal("invalid trust type '" + type + "': must be accept, reject, signedBy or sigstoreSigned");
  }
  return requirements;
}

} // namespace

engine::v1::ShowTrustReport ShowTrustPolicy(const std::filesystem::path& policy_path, const std::filesystem::path& registries_dir,
                                            bool raw) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(policy_path, ec)) {
    throw util::NotFound("trust policy " + policy_path.string() + " does not exist");
  }

  const auto                  json = ReadFile(policy_path);
  engine::v1::ShowTrustReport report;
  if (raw) {
    report.set_raw(json);
    return report;
  }

  const Struct policy = ParsePolicy(json, policy_path);
  const auto   stores = LoadSigStores(registries_dir);

  auto def = policy.fields().find("default");
  if (def != policy.fields().end() && def->second.kind_case() == Value::kListValue) {
    *report.add_policies() = DescribeRequirements("default", "all", def->second.list_value(), stores.default_store);
  }

  auto transports = policy.fields().find("transports");
  if (transports == policy.fields().end() || transports->second.kind_case() != Value::kStructValue) {
    return report;
  }

  // protobuf maps are unordered
  std::map<std::string, const Struct*> by_transport;
  for (const auto& [name, scopes] : transports->second.struct_value().fields()) {
    if (scopes.kind_case() == Value::kStructValue) {
      by_transport[name] = &scopes.struct_value();
    }
  }
  for (const auto& [transport, scopes] : by_transport) {
    std::map<std::string, const ListValue*> by_scope;
    for (const auto& [scope, requirements] : scopes->fields()) {
      if (requirements.kind_case() == Value::kListValue) {
        by_scope[scope] = &requirements.list_value();
      }
    }
    for (const auto& [scope, requirements] : by_scope) {
      auto store = stores.by_scope.find(scope);
      *report.add_policies() =
          DescribeRequirements(scope, transport, *requirements, store == stores.by_scope.end() ? stores.default_store : store->second);
    }
  }
  return report;
}

void SetTrustPolicy(const std::filesystem::path& policy_path, const std::string& scope, const engine::v1::SetTrustOptions& options) {
  if (scope.empty()) {
    throw util::Internal("trust scope must be \"default\" or a repository");
  }

  const auto requirements = BuildRequirements(options);

  std::error_code ec;
  Struct          policy = std::filesystem::exists(policy_path, ec) ? ParsePolicy(ReadFile(policy_path), policy_path)
                                                                    : ParsePolicy(kDefaultPolicy, policy_path);

  auto& fields = *policy.mutable_fields();
  if (scope == "default") {
    *fields["default"].mutable_list_value() = requirements;
  } else {
    auto& transports = *fields["transports"].mutable_struct_value()->mutable_fields();
    auto& docker     = *transports["docker"].mutable_struct_value()->mutable_fields();
    *docker[scope].mutable_list_value() = requirements;
  }

  std::string                                json;
  google::protobuf::util::JsonPrintOptions print;
  print.add_whitespace = true;
  const auto status    = google::protobuf::util::MessageToJsonString(policy, &json, print);
  if (!status.ok()) {
    throw util::Internal("encode trust policy: " + std::string(status.message()));
  }

  if (policy_path.has_parent_path()) {
    std::filesystem::create_directories(policy_path.parent_path());
  }
  auto tmp = policy_path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw util::Internal("unable to write " + tmp.string());
    }
    out << json;
  }
  std::filesystem::rename(tmp, policy_path);
}

} // namespace berth::runtime
