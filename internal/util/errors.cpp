#include "errors.hpp"

namespace berth::util {

using namespace berth::engine::v1;

ErrorKind Classify(const std::exception& e) {
  if (dynamic_cast<const NotFound*>(&e)) {
    return ERROR_KIND_NOT_FOUND;
  }
  if (dynamic_cast<const Conflict*>(&e)) {
    return ERROR_KIND_CONFLICT;
  }
  if (dynamic_cast<const Unsupported*>(&e)) {
    return ERROR_KIND_UNSUPPORTED;
  }
  if (dynamic_cast<const TransportFailure*>(&e)) {
    return ERROR_KIND_TRANSPORT_FAILURE;
  }
  if (dynamic_cast<const StreamClosed*>(&e)) {
    return ERROR_KIND_STREAM_CLOSED;
  }

  return ERROR_KIND_INTERNAL;
}

const char* KindName(ErrorKind kind) {
  switch (kind) {
    case ERROR_KIND_NOT_FOUND:
      return "not found";
    case ERROR_KIND_CONFLICT:
      return "conflict";
    case ERROR_KIND_UNSUPPORTED:
      return "unsupported";
    case ERROR_KIND_TRANSPORT_FAILURE:
      return "transport failure";
    case ERROR_KIND_STREAM_CLOSED:
      return "stream closed";
    default:
      return "internal";
  }
}

UnitError ToUnitError(const std::string& unit, const std::exception& e) {
  UnitError err;
  err.set_unit(unit);
  err.set_kind(Classify(e));
  err.set_message(e.what());
  return err;
}

void Raise(ErrorKind kind, const std::string& message) {
  switch (kind) {
    case ERROR_KIND_NOT_FOUND:
      throw NotFound(message);
    case ERROR_KIND_CONFLICT:
      throw Conflict(message);
    case ERROR_KIND_UNSUPPORTED:
      throw Unsupported(message);
    case ERROR_KIND_TRANSPORT_FAILURE:
      throw TransportFailure(message);
    case ERROR_KIND_STREAM_CLOSED:
      throw StreamClosed(message);
    default:
      throw Internal(message);
  }
}

} // namespace berth::util
