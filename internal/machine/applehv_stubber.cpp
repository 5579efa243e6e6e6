#include "applehv_stubber.hpp"

#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace berth::machine {

namespace {

StateReport Translate(const std::optional<berth::machine::v1::VfkitState>& state) {
  StateReport report;
  if (!state) {
    report.status = VmStatus::kStopped;
    return report;
  }

  const auto& name = state->state();
  if (name == "VirtualMachineStateRunning") {
    report.status = VmStatus::kRunning;
  } else if (name == "VirtualMachineStateStarting") {
    report.status = VmStatus::kStarting;
  } else if (name == "VirtualMachineStateStopped") {
    report.status = VmStatus::kStopped;
  } else if (name == "VirtualMachineStateError") {
    throw util::Internal("vfkit reports the machine in error state");
  } else {
    report.status = VmStatus::kUnknown;
    report.messages.push_back("unrecognised vfkit state \"" + name + "\"");
  }
  return report;
}

bool Active(VmStatus status) {
  return status == VmStatus::kRunning || status == VmStatus::kStarting;
}

} // namespace

AppleHvStubber::AppleHvStubber(std::chrono::milliseconds stop_timeout, std::chrono::milliseconds request_timeout)
    : stop_timeout_(stop_timeout), request_timeout_(request_timeout) {
}

VfkitClient AppleHvStubber::Client(const berth::machine::v1::MachineConfig& config) const {
  if (config.vfkit_endpoint().empty()) {
    throw util::Internal("machine " + config.name() + " has no vfkit endpoint");
  }
  return VfkitClient(config.vfkit_endpoint(), request_timeout_);
}

StateReport AppleHvStubber::State(const berth::machine::v1::MachineConfig& config) {
  return Translate(Client(config).State());
}

StopReport AppleHvStubber::StopVM(const berth::machine::v1::MachineConfig& config, bool force) {
  StopReport report;
  const auto client = Client(config);

  if (!Active(Translate(client.State()).status)) {
    report.messages.push_back("machine " + config.name() + " is not running");
    return report;
  }

  client.ChangeState(force ? "HardStop" : "Stop");

  const auto deadline = std::chrono::steady_clock::now() + stop_timeout_;
  while (Translate(client.State()).status != VmStatus::kStopped) {
    if (std::chrono::steady_clock::now() >= deadline) {
      report.messages.push_back("machine " + config.name() + " did not stop within the timeout");
      return report;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  BERTH_LOG_INFO("machine stopped", {observability::StringField("machine", config.name()), observability::StringField("provider", "applehv"),
                                     observability::BoolField("force", force)});
  return report;
}

RemoveReport AppleHvStubber::Remove(const berth::machine::v1::MachineConfig& config) {
  if (Active(State(config).status)) {
    throw util::Conflict("machine " + config.name() + " is running: stop it before removing");
  }
  return {};
}

} // namespace berth::machine
