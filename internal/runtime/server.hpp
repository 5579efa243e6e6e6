#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace berth::runtime {

struct ServerOptions {
  std::string bind_address;
  // Server side TLS; both empty means plaintext.
  std::string tls_cert_file;
  std::string tls_key_file;
  // When set, clients must present a certificate signed by this CA.
  std::string tls_client_ca_file;

  static ServerOptions FromConfig(const berth::config::ServerConfig& config);
};

class Server {
public:
  Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  // In-flight calls (open event streams included) are cancelled after `grace`.
  void Stop(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

  // Port actually bound; meaningful for tcp addresses after Start().
  int Port() const { return port_; }

private:
  std::shared_ptr<::grpc::ServerCredentials> Credentials() const;

  ServerOptions options_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server> grpc_server_;
  int port_ = 0;
};

} // namespace berth::runtime
