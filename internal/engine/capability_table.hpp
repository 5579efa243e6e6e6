#pragma once

#include <map>
#include <optional>
#include <string>

namespace berth::engine {

enum class Operation {
  kHealthCheckRun,
  kAutoUpdate,
  kEvents,
  kInfo,
  kNetworkUpdate,
  kImageUntag,
  kImageInspect,
  kArtifactPull,
  kShowTrust,
  kSetTrust,
};

const char* OperationName(Operation op);

/*
  Per operation declaration of what a backend can serve.

  Unsupported operations fail before any transport work with
  util::Unsupported carrying the declared reason.

  Declaring an operation supported only widens what a backend accepts
  when the backend has a procedure for it. RemoteEngine rejects tables
  that declare AutoUpdate, ShowTrust or SetTrust supported.
*/
class CapabilityTable {
 public:
  static constexpr const char* kNotImplemented = "not implemented";

  // Everything supported.
  CapabilityTable() = default;

  // Current remote protocol: no auto-update, no trust management.
  static CapabilityTable RemoteProtocol();

  CapabilityTable& Declare(Operation op, bool supported, std::string reason = kNotImplemented);

  bool Supports(Operation op) const;

  std::optional<std::string> UnsupportedReason(Operation op) const;

  // Throws util::Unsupported when `op` is not supported.
  void Require(Operation op) const;

 private:
  std::map<Operation, std::string> unsupported_;
};

} // namespace berth::engine
