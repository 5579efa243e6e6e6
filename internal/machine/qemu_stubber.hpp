#pragma once

#include <chrono>

#include "internal/machine/vm_stubber.hpp"

namespace berth::machine {

/*
  QEMU machines tracked through their pid file.

  A live pid means running, or starting while the API socket has not
  appeared yet. StopVM sends SIGTERM (SIGKILL when forced) and waits up
  to stop_timeout for the process to go away.
*/
class QemuStubber final : public VmStubber {
 public:
  explicit QemuStubber(std::chrono::milliseconds stop_timeout = std::chrono::seconds(10));

  std::string Provider() const override {
    return "qemu";
  }

  StateReport  State(const berth::machine::v1::MachineConfig& config) override;
  StopReport   StopVM(const berth::machine::v1::MachineConfig& config, bool force) override;
  RemoveReport Remove(const berth::machine::v1::MachineConfig& config) override;

 private:
  std::chrono::milliseconds stop_timeout_;
};

} // namespace berth::machine
