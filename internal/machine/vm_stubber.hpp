#pragma once

#include <string>
#include <vector>

#include "berth/machine/v1/machine.pb.h"

namespace berth::machine {

enum class VmStatus {
  kRunning,
  kStopped,
  kStarting,
  kUnknown,
};

const char* VmStatusName(VmStatus status);

// Every report carries the non-fatal messages collected on the way.
struct StateReport {
  VmStatus                 status = VmStatus::kUnknown;
  std::vector<std::string> messages;
};

struct StopReport {
  std::vector<std::string> messages;
};

struct RemoveReport {
  std::vector<std::string> removed;
  std::vector<std::string> messages;
};

/*
  Lifecycle contract of one hypervisor family.

  Remove is idempotent: removing an absent machine succeeds with nothing
  removed. Removing a running machine is util::Conflict.
*/
class VmStubber {
 public:
  virtual ~VmStubber() = default;

  virtual std::string Provider() const = 0;

  virtual StateReport State(const berth::machine::v1::MachineConfig& config) = 0;

  virtual StopReport StopVM(const berth::machine::v1::MachineConfig& config, bool force) = 0;

  virtual RemoveReport Remove(const berth::machine::v1::MachineConfig& config) = 0;
};

} // namespace berth::machine
