#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "berth/machine/v1/machine.pb.h"

namespace berth::machine {

/*
  Client for the REST endpoint vfkit serves with --restful-uri.

  `endpoint` is unix:///path/to.sock, tcp://host:port or an http:// URL.
  Nothing listening there is how a stopped vfkit looks: State() returns
  std::nullopt instead of failing.
*/
class VfkitClient {
 public:
  VfkitClient(const std::string& endpoint, std::chrono::milliseconds timeout);

  std::optional<berth::machine::v1::VfkitState> State() const;

  // "Stop" asks the guest to shut down, "HardStop" ends the VM.
  void ChangeState(const std::string& state) const;

 private:
  struct Response {
    long        status = 0;
    std::string body;
  };

  std::optional<Response> Send(bool post, const std::string& body) const;

  std::string               endpoint_;
  std::string               socket_path_;
  std::string               url_;
  std::chrono::milliseconds timeout_;
};

} // namespace berth::machine
