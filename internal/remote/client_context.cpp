#include "client_context.hpp"

#include "internal/util/errors.hpp"

namespace berth::remote {

ClientContext::CallScope::CallScope(std::stop_token root, std::stop_token caller, const std::string& identity_token,
                                    std::optional<std::chrono::milliseconds> timeout) {
  if (!identity_token.empty()) {
    context_.AddMetadata(kIdentityMetadata, identity_token);
  }
  if (timeout) {
    context_.set_deadline(std::chrono::system_clock::now() + *timeout);
  }

  on_close_.emplace(root, std::function<void()>([this] {
                      cancelled_by_close_.store(true);
                      context_.TryCancel();
                    }));
  on_caller_stop_.emplace(caller, std::function<void()>([this] {
                            cancelled_by_caller_.store(true);
                            context_.TryCancel();
                          }));
}

ClientContext::ClientContext(std::shared_ptr<::grpc::Channel> channel, std::string target, std::string identity_token)
    : channel_(std::move(channel)), target_(std::move(target)), identity_token_(std::move(identity_token)) {
}

ClientContext::~ClientContext() {
  Close();
}

std::unique_ptr<ClientContext::CallScope> ClientContext::NewCall(std::stop_token caller, std::optional<std::chrono::milliseconds> timeout) {
  if (Closed()) {
    throw util::TransportFailure("connection to " + target_ + " is closed");
  }
  return std::make_unique<CallScope>(root_.get_token(), std::move(caller), identity_token_, timeout);
}

void ClientContext::Close() {
  root_.request_stop();
}

} // namespace berth::remote
