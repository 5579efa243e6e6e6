#include "connection_descriptor.hpp"

#include "internal/machine/env.hpp"
#include "internal/util/errors.hpp"

namespace berth::engine {

ConnectionDescriptor::ConnectionDescriptor(std::string uri, std::string identity_path, TlsMaterial tls, std::optional<MachineTarget> machine,
                                           std::chrono::milliseconds connect_timeout)
    : uri_(std::move(uri)),
      identity_path_(std::move(identity_path)),
      tls_(std::move(tls)),
      machine_(std::move(machine)),
      connect_timeout_(connect_timeout) {
}

ConnectionDescriptor ConnectionDescriptor::FromConfig(const berth::config::EngineConfig& config) {
  const auto& remote = config.remote();

  TlsMaterial tls{remote.tls_cert_file(), remote.tls_key_file(), remote.tls_ca_file()};
  const auto  timeout =
      remote.connect_timeout_ms() == 0 ? kDefaultConnectTimeout : std::chrono::milliseconds(remote.connect_timeout_ms());

  std::optional<MachineTarget> machine;
  if (remote.machine()) {
    const auto& m = config.machine();
    if (m.name().empty()) {
      throw util::Internal("machine.name is required for a machine-mediated connection");
    }
    const std::string provider = m.provider().empty() ? "qemu" : m.provider();
    machine = MachineTarget{m.name(), provider, m.config_dir().empty() ? machine::ConfigDir(provider) : std::filesystem::path(m.config_dir())};
  } else if (remote.uri().empty()) {
    throw util::Internal("remote.uri is required in remote mode");
  }

  return ConnectionDescriptor(remote.uri(), remote.identity(), std::move(tls), std::move(machine), timeout);
}

} // namespace berth::engine
