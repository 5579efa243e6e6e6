#pragma once

#include <google/protobuf/message.h>
#include <grpcpp/grpcpp.h>

#include <string>
#include <utility>
#include <vector>

#include "berth/engine/v1.hpp"
#include "internal/auth/registry_auth.hpp"
#include "internal/util/errors.hpp"

namespace berth::remote {

using Params = std::vector<std::pair<std::string, std::string>>;

/*
  Flattens a request into name/value parameters. Fields without
  presence are skipped, so an unset optional never travels as an empty
  value. Repeated fields produce one entry per element; nested messages
  use dotted names.
*/
Params ToParams(const google::protobuf::Message& message);

std::string DescribeParams(const Params& params);

/*
  Request body for an artifact pull. Credentials are moved out of the
  body into the returned headers.
*/
engine::v1::ArtifactPullRequest EncodeArtifactPull(const std::string& name, const engine::v1::ArtifactPullOptions& options,
                                                   auth::Headers* headers);

util::ErrorKind KindFromStatus(::grpc::StatusCode code);

// Throws the util:: error matching a failed status. The message is kept as sent.
[[noreturn]] void RaiseStatus(const ::grpc::Status& status);

} // namespace berth::remote
