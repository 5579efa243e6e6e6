#include "server.hpp"

#include <fstream>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace berth::runtime {

namespace {

std::string ReadPem(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::Internal("read tls file " + path + ": cannot open file");
  }
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

}

ServerOptions ServerOptions::FromConfig(const berth::config::ServerConfig& config) {
  ServerOptions options;
  options.bind_address       = config.bind_address();
  options.tls_cert_file      = config.tls_cert_file();
  options.tls_key_file       = config.tls_key_file();
  options.tls_client_ca_file = config.tls_client_ca_file();
  return options;
}

Server::Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services)
    : options_(std::move(options)), services_(std::move(services)) {}

Server::~Server() {
  Stop();
}

std::shared_ptr<::grpc::ServerCredentials> Server::Credentials() const {
  if (options_.tls_cert_file.empty() && options_.tls_key_file.empty()) {
    return ::grpc::InsecureServerCredentials();
  }
  if (options_.tls_cert_file.empty() || options_.tls_key_file.empty()) {
    throw util::Internal("server tls requires both a certificate and a key");
  }

  ::grpc::SslServerCredentialsOptions ssl(options_.tls_client_ca_file.empty()
                                            ? GRPC_SSL_DONT_REQUEST_CLIENT_CERTIFICATE
                                            : GRPC_SSL_REQUEST_AND_REQUIRE_CLIENT_CERTIFICATE_AND_VERIFY);
  ssl.pem_key_cert_pairs.push_back({ReadPem(options_.tls_key_file), ReadPem(options_.tls_cert_file)});
  if (!options_.tls_client_ca_file.empty()) {
    ssl.pem_root_certs = ReadPem(options_.tls_client_ca_file);
  }
  return ::grpc::SslServerCredentials(ssl);
}

void Server::Start() {
  if (options_.bind_address.empty()) {
    throw util::Internal("server bind address is not configured");
  }

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(options_.bind_address, Credentials(), &port_);

  for (const auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_) {
    throw util::Internal("failed to start gRPC server on " + options_.bind_address);
  }

  BERTH_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", options_.bind_address),
                                            observability::IntField("port", port_)});
}

void Server::Wait() {
  if (grpc_server_)
    grpc_server_->Wait();
}

void Server::Stop(std::chrono::milliseconds grace) {
  if (grpc_server_) {
    grpc_server_->Shutdown(std::chrono::system_clock::now() + grace);
    grpc_server_.reset();
  }
}

} // namespace berth::runtime
