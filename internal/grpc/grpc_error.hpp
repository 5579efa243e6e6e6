#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace berth::grpc {

/*
  Converts engine exceptions into gRPC status codes. The remote backend
  maps the codes back, so the message is passed through untouched.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace berth::grpc
