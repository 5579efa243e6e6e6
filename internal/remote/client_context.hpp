#pragma once

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace berth::remote {

inline constexpr char kIdentityMetadata[] = "x-berth-identity";

/*
  Negotiated remote execution context.

  Holds the channel, the identity token and the root cancellation scope.
  Every call gets its own CallScope (own ::grpc::ClientContext) linked to
  the root and to the caller's token: closing the context cancels every
  call in flight, a caller's stop request cancels only that caller's call.
*/
class ClientContext {
 public:
  class CallScope {
   public:
    CallScope(std::stop_token root, std::stop_token caller, const std::string& identity_token,
              std::optional<std::chrono::milliseconds> timeout);

    CallScope(const CallScope&)            = delete;
    CallScope& operator=(const CallScope&) = delete;

    ::grpc::ClientContext& Context() {
      return context_;
    }

    bool CancelledByCaller() const {
      return cancelled_by_caller_.load();
    }
    bool CancelledByClose() const {
      return cancelled_by_close_.load();
    }

   private:
    // Callbacks reference context_ and are declared after it so they go first.
    ::grpc::ClientContext                                  context_;
    std::atomic<bool>                                    cancelled_by_caller_{false};
    std::atomic<bool>                                    cancelled_by_close_{false};
    std::optional<std::stop_callback<std::function<void()>>> on_close_;
    std::optional<std::stop_callback<std::function<void()>>> on_caller_stop_;
  };

  ClientContext(std::shared_ptr<::grpc::Channel> channel, std::string target, std::string identity_token);
  ~ClientContext();

  ClientContext(const ClientContext&)            = delete;
  ClientContext& operator=(const ClientContext&) = delete;

  // Throws util::TransportFailure once the context is closed.
  std::unique_ptr<CallScope> NewCall(std::stop_token caller = {}, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  // Cancels in-flight calls; later NewCall() fails.
  void Close();

  bool Closed() const {
    return root_.stop_requested();
  }

  const std::shared_ptr<::grpc::Channel>& Channel() const {
    return channel_;
  }

  const std::string& Target() const {
    return target_;
  }

 private:
  std::shared_ptr<::grpc::Channel> channel_;
  std::string                    target_;
  std::string                    identity_token_;
  std::stop_source               root_;
};

} // namespace berth::remote
