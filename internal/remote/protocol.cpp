#include "protocol.hpp"

#include <google/protobuf/descriptor.h>

namespace berth::remote {

namespace {

using google::protobuf::FieldDescriptor;
using google::protobuf::Message;
using google::protobuf::Reflection;

std::string ScalarValue(const Message& message, const Reflection& reflection, const FieldDescriptor& field, int index) {
  const bool repeated = index >= 0;
  switch (field.cpp_type()) {
    case FieldDescriptor::CPPTYPE_STRING:
      return repeated ? reflection.GetRepeatedString(message, &field, index) : reflection.GetString(message, &field);
    case FieldDescriptor::CPPTYPE_BOOL:
      return (repeated ? reflection.GetRepeatedBool(message, &field, index) : reflection.GetBool(message, &field)) ? "true" : "false";
    case FieldDescriptor::CPPTYPE_INT32:
      return std::to_string(repeated ? reflection.GetRepeatedInt32(message, &field, index) : reflection.GetInt32(message, &field));
    case FieldDescriptor::CPPTYPE_INT64:
      return std::to_string(repeated ? reflection.GetRepeatedInt64(message, &field, index) : reflection.GetInt64(message, &field));
    case FieldDescriptor::CPPTYPE_UINT32:
      return std::to_string(repeated ? reflection.GetRepeatedUInt32(message, &field, index) : reflection.GetUInt32(message, &field));
    case FieldDescriptor::CPPTYPE_UINT64:
      return std::to_string(repeated ? reflection.GetRepeatedUInt64(message, &field, index) : reflection.GetUInt64(message, &field));
    case FieldDescriptor::CPPTYPE_DOUBLE:
      return std::to_string(repeated ? reflection.GetRepeatedDouble(message, &field, index) : reflection.GetDouble(message, &field));
    case FieldDescriptor::CPPTYPE_FLOAT:
      return std::to_string(repeated ? reflection.GetRepeatedFloat(message, &field, index) : reflection.GetFloat(message, &field));
    case FieldDescriptor::CPPTYPE_ENUM:
      return repeated ? reflection.GetRepeatedEnum(message, &field, index)->name() : reflection.GetEnum(message, &field)->name();
    case FieldDescriptor::CPPTYPE_MESSAGE:
      break;
  }
  return {};
}

void Flatten(const Message& message, const std::string& prefix, Params& out) {
  const auto* descriptor = message.GetDescriptor();
  const auto* reflection = message.GetReflection();

  for (int i = 0; i < descriptor->field_count(); ++i) {
    const auto* field = descriptor->field(i);
    const auto  name  = prefix.empty() ? field->name() : prefix + "." + field->name();

    if (field->is_repeated()) {
      if (field->is_map()) continue;
      const int size = reflection->FieldSize(message, field);
      for (int j = 0; j < size; ++j) {
        if (field->cpp_type() == FieldDescriptor::CPPTYPE_MESSAGE) {
          Flatten(reflection->GetRepeatedMessage(message, field, j), name, out);
        } else {
          out.emplace_back(name, ScalarValue(message, *reflection, *field, j));
        }
      }
      continue;
    }

    if (!reflection->HasField(message, field)) continue;

    if (field->cpp_type() == FieldDescriptor::CPPTYPE_MESSAGE) {
      Flatten(reflection->GetMessage(message, field), name, out);
    } else {
      out.emplace_back(name, ScalarValue(message, *reflection, *field, -1));
    }
  }
}

} // namespace

Params ToParams(const Message& message) {
  Params out;
  Flatten(message, {}, out);
  return out;
}

std::string DescribeParams(const Params& params) {
  std::string out;
  for (const auto& [name, value] : params) {
    if (!out.empty()) out += ' ';
    out += name + "=" + value;
  }
  return out;
}

engine::v1::ArtifactPullRequest EncodeArtifactPull(const std::string& name, const engine::v1::ArtifactPullOptions& options,
                                                   auth::Headers* headers) {
  *headers = auth::MakeRegistryAuthHeaders(auth::SystemContext{options.authfile()}, options.username(), options.password());

  engine::v1::ArtifactPullRequest request;
  request.set_name(name);
  *request.mutable_options() = options;
  request.mutable_options()->clear_authfile();
  request.mutable_options()->clear_username();
  request.mutable_options()->clear_password();
  return request;
}

util::ErrorKind KindFromStatus(::grpc::StatusCode code) {
  switch (code) {
    case ::grpc::StatusCode::NOT_FOUND:
      return engine::v1::ERROR_KIND_NOT_FOUND;
    case ::grpc::StatusCode::FAILED_PRECONDITION:
    case ::grpc::StatusCode::ALREADY_EXISTS:
      return engine::v1::ERROR_KIND_CONFLICT;
    case ::grpc::StatusCode::UNIMPLEMENTED:
      return engine::v1::ERROR_KIND_UNSUPPORTED;
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
    case ::grpc::StatusCode::UNAUTHENTICATED:
    case ::grpc::StatusCode::PERMISSION_DENIED:
    case ::grpc::StatusCode::CANCELLED:
      return engine::v1::ERROR_KIND_TRANSPORT_FAILURE;
    case ::grpc::StatusCode::ABORTED:
      return engine::v1::ERROR_KIND_STREAM_CLOSED;
    default:
      return engine::v1::ERROR_KIND_INTERNAL;
  }
}

void RaiseStatus(const ::grpc::Status& status) {
  util::Raise(KindFromStatus(status.error_code()), status.error_message());
}

} // namespace berth::remote
