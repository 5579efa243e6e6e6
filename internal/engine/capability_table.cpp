#include "capability_table.hpp"

#include "internal/util/errors.hpp"

namespace berth::engine {

const char* OperationName(Operation op) {
  switch (op) {
    case Operation::kHealthCheckRun:
      return "HealthCheckRun";
    case Operation::kAutoUpdate:
      return "AutoUpdate";
    case Operation::kEvents:
      return "Events";
    case Operation::kInfo:
      return "Info";
    case Operation::kNetworkUpdate:
      return "NetworkUpdate";
    case Operation::kImageUntag:
      return "ImageUntag";
    case Operation::kImageInspect:
      return "ImageInspect";
    case Operation::kArtifactPull:
      return "ArtifactPull";
    case Operation::kShowTrust:
      return "ShowTrust";
    case Operation::kSetTrust:
      return "SetTrust";
  }
  return "Unknown";
}

CapabilityTable CapabilityTable::RemoteProtocol() {
  CapabilityTable table;
  table.Declare(Operation::kAutoUpdate, false).Declare(Operation::kShowTrust, false).Declare(Operation::kSetTrust, false);
  return table;
}

CapabilityTable& CapabilityTable::Declare(Operation op, bool supported, std::string reason) {
  if (supported) {
    unsupported_.erase(op);
  } else {
    unsupported_[op] = std::move(reason);
  }
  return *this;
}

bool CapabilityTable::Supports(Operation op) const {
  return !unsupported_.contains(op);
}

std::optional<std::string> CapabilityTable::UnsupportedReason(Operation op) const {
  auto it = unsupported_.find(op);
  if (it == unsupported_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void CapabilityTable::Require(Operation op) const {
  if (auto reason = UnsupportedReason(op)) {
    throw util::Unsupported(*reason);
  }
}

} // namespace berth::engine
