#include "grpc_error.hpp"

namespace berth::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace berth::engine::v1;

  switch (util::Classify(e)) {
    case ERROR_KIND_NOT_FOUND:
      return {::grpc::StatusCode::NOT_FOUND, e.what()};
    case ERROR_KIND_CONFLICT:
      return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
    case ERROR_KIND_UNSUPPORTED:
      return {::grpc::StatusCode::UNIMPLEMENTED, e.what()};
    case ERROR_KIND_TRANSPORT_FAILURE:
      return {::grpc::StatusCode::UNAVAILABLE, e.what()};
    case ERROR_KIND_STREAM_CLOSED:
      return {::grpc::StatusCode::ABORTED, e.what()};
    default:
      return {::grpc::StatusCode::INTERNAL, e.what()};
  }
}

} // namespace berth::grpc
