#pragma once

#include <stdexcept>
#include <string>

#include "berth/engine/v1/types.pb.h"

namespace berth::util {

/*
  Central error types.

  Both backends throw these; the gRPC adapter translates them to status
  codes and the remote backend translates status codes back, so a caller
  sees the same shape regardless of where the call ran.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Entity exists but its state does not allow the request.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Operation has no implementation in the active mode or platform.
class Unsupported : public std::runtime_error {
 public:
  explicit Unsupported(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Connection level failure: unreachable endpoint, TLS or identity problems,
// machine not running.
class TransportFailure : public std::runtime_error {
 public:
  explicit TransportFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Internal : public std::runtime_error {
 public:
  explicit Internal(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A streaming subscription was closed by the producing side.
class StreamClosed : public std::runtime_error {
 public:
  explicit StreamClosed(const std::string& msg) : std::runtime_error(msg) {
  }
};

using ErrorKind = berth::engine::v1::ErrorKind;

ErrorKind Classify(const std::exception& e);

const char* KindName(ErrorKind kind);

berth::engine::v1::UnitError ToUnitError(const std::string& unit, const std::exception& e);

// Rethrows a unit error as the matching exception type.
[[noreturn]] void Raise(ErrorKind kind, const std::string& message);

} // namespace berth::util
