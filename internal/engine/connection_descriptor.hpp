#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "config/config.pb.h"

namespace berth::engine {

struct TlsMaterial {
  std::string cert_file;
  std::string key_file;
  std::string ca_file;

  bool Empty() const {
    return cert_file.empty() && key_file.empty() && ca_file.empty();
  }
};

// The VM that fronts a machine-mediated endpoint.
struct MachineTarget {
  std::string           name;
  std::string           provider;
  std::filesystem::path config_dir;
};

/*
  How to reach a remote engine. Immutable after construction.

  A machine-mediated descriptor carries no URI; the address is resolved
  from the machine's artifacts at negotiation time.
*/
class ConnectionDescriptor {
 public:
  static constexpr std::chrono::milliseconds kDefaultConnectTimeout{5000};

  ConnectionDescriptor(std::string uri, std::string identity_path, TlsMaterial tls, std::optional<MachineTarget> machine,
                       std::chrono::milliseconds connect_timeout = kDefaultConnectTimeout);

  /*
    Builds the descriptor from remote.* and machine.*. Throws
    util::Internal when a direct descriptor has no URI or a
    machine-mediated one has no machine name.
  */
  static ConnectionDescriptor FromConfig(const berth::config::EngineConfig& config);

  const std::string& Uri() const {
    return uri_;
  }
  const std::string& IdentityPath() const {
    return identity_path_;
  }
  const TlsMaterial& Tls() const {
    return tls_;
  }
  bool MachineMediated() const {
    return machine_.has_value();
  }
  const std::optional<MachineTarget>& Machine() const {
    return machine_;
  }
  std::chrono::milliseconds ConnectTimeout() const {
    return connect_timeout_;
  }

 private:
  std::string                  uri_;
  std::string                  identity_path_;
  TlsMaterial                  tls_;
  std::optional<MachineTarget> machine_;
  std::chrono::milliseconds    connect_timeout_;
};

} // namespace berth::engine
