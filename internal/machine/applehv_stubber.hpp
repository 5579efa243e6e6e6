#pragma once

#include <chrono>

#include "internal/machine/vfkit_client.hpp"
#include "internal/machine/vm_stubber.hpp"

namespace berth::machine {

/*
  Apple Hypervisor machines run by vfkit and driven over its REST
  endpoint (MachineConfig.vfkit_endpoint).

  State is what vfkit reports; an endpoint nobody listens on is a
  stopped machine. StopVM requests "Stop", or "HardStop" when forced,
  then polls until vfkit reports stopped or goes away. vfkit owns no
  files of its own, so Remove has nothing to delete.
*/
class AppleHvStubber final : public VmStubber {
 public:
  explicit AppleHvStubber(std::chrono::milliseconds stop_timeout    = std::chrono::seconds(30),
                          std::chrono::milliseconds request_timeout = std::chrono::seconds(2));

  std::string Provider() const override {
    return "applehv";
  }

  StateReport  State(const berth::machine::v1::MachineConfig& config) override;
  StopReport   StopVM(const berth::machine::v1::MachineConfig& config, bool force) override;
  RemoveReport Remove(const berth::machine::v1::MachineConfig& config) override;

 private:
  VfkitClient Client(const berth::machine::v1::MachineConfig& config) const;

  std::chrono::milliseconds stop_timeout_;
  std::chrono::milliseconds request_timeout_;
};

} // namespace berth::machine
