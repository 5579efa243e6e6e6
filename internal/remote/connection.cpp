#include "connection.hpp"

#include <chrono>
#include <fstream>
#include <sstream>

#include "internal/machine/provider.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace berth::remote {

namespace {

std::string ReadFile(const std::string& path, const char* what) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::TransportFailure(std::string("read ") + what + " " + path + ": cannot open file");
  }
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

std::string Trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::string MachineUri(const engine::MachineTarget& target, const NegotiationOptions& options) {
  const auto loader = options.config_loader ? options.config_loader : MachineConfigLoader(machine::LoadMachineConfig);
  const auto lookup = options.stubber_lookup ? options.stubber_lookup : StubberLookup(machine::LookupStubber);

  berth::machine::v1::MachineConfig config;
  std::unique_ptr<machine::VmStubber> stubber;
  try {
    config  = loader(target.config_dir, target.name);
    stubber = lookup(target.provider);
  } catch (const util::TransportFailure&) {
    throw;
  } catch (const std::exception& e) {
    throw util::TransportFailure("machine " + target.name + ": " + e.what());
  }

  const auto state = stubber->State(config);
  for (const auto& message : state.messages) {
    BERTH_LOG_DEBUG("machine state message", {observability::StringField("machine", target.name),
                                              observability::StringField("message", message)});
  }
  if (state.status != machine::VmStatus::kRunning) {
    throw util::TransportFailure("machine " + target.name + " is not running");
  }

  return machine::ResolveTransportAddress(options.platform, config).Uri();
}

} // namespace

std::string ResolveTarget(const std::string& uri) {
  const auto sep = uri.find("://");
  if (sep == std::string::npos) {
    throw util::TransportFailure("invalid connection uri \"" + uri + "\"");
  }
  const auto scheme = uri.substr(0, sep);
  const auto rest   = uri.substr(sep + 3);

  if (scheme == "unix") {
    if (rest.empty()) throw util::TransportFailure("invalid connection uri \"" + uri + "\": missing socket path");
    return "unix:" + rest;
  }
  if (scheme == "tcp") {
    if (rest.empty()) throw util::TransportFailure("invalid connection uri \"" + uri + "\": missing host");
    return rest;
  }
  throw util::TransportFailure("unsupported connection scheme \"" + scheme + "\"");
}

std::shared_ptr<::grpc::ChannelCredentials> BuildChannelCredentials(const engine::TlsMaterial& tls) {
  if (tls.Empty()) {
    return ::grpc::InsecureChannelCredentials();
  }
  if (tls.cert_file.empty() != tls.key_file.empty()) {
    throw util::TransportFailure("tls client certificate and key must be configured together");
  }

  ::grpc::SslCredentialsOptions ssl;
  if (!tls.ca_file.empty()) ssl.pem_root_certs = ReadFile(tls.ca_file, "tls ca");
  if (!tls.cert_file.empty()) {
    ssl.pem_cert_chain  = ReadFile(tls.cert_file, "tls certificate");
    ssl.pem_private_key = ReadFile(tls.key_file, "tls key");
  }
  return ::grpc::SslCredentials(ssl);
}

std::string ReadIdentityToken(const std::string& identity_path) {
  if (identity_path.empty()) return {};
  const auto contents = ReadFile(identity_path, "identity");
  return Trim(contents.substr(0, contents.find('\n')));
}

std::shared_ptr<ClientContext> NegotiateConnection(const engine::ConnectionDescriptor& descriptor, const NegotiationOptions& options) {
  const auto uri = descriptor.MachineMediated() ? MachineUri(*descriptor.Machine(), options) : descriptor.Uri();

  const auto target   = ResolveTarget(uri);
  const auto creds    = BuildChannelCredentials(descriptor.Tls());
  const auto identity = ReadIdentityToken(descriptor.IdentityPath());

  auto channel = options.channel_factory ? options.channel_factory(target, creds) : ::grpc::CreateChannel(target, creds);
  if (!channel) {
    throw util::TransportFailure("cannot create channel to " + uri);
  }

  if (options.wait_for_connected) {
    const auto deadline = std::chrono::system_clock::now() + descriptor.ConnectTimeout();
    if (!channel->WaitForConnected(deadline)) {
      throw util::TransportFailure("cannot connect to " + uri + ": not ready within " +
                                   std::to_string(descriptor.ConnectTimeout().count()) + "ms");
    }
  }

  BERTH_LOG_INFO("remote connection negotiated",
                 {observability::StringField("uri", uri), observability::BoolField("machine", descriptor.MachineMediated()),
                  observability::BoolField("tls", !descriptor.Tls().Empty())});

  return std::make_shared<ClientContext>(std::move(channel), uri, identity);
}

} // namespace berth::remote
