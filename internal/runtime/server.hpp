#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace mirrorsync::runtime {

/*
  Owns the gRPC server and the service adapters registered on it.
*/
class Server {
 public:
  Server(std::string bind_address, std::vector<std::shared_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  // Throws std::runtime_error when the port cannot be bound.
  void Start();
  void Wait();
  void Stop();

  // Port actually bound; differs from the configured one when it was 0.
  int Port() const {
    return port_;
  }

  std::shared_ptr<::grpc::Channel> InProcessChannel();

 private:
  std::string                                  bind_address_;
  std::vector<std::shared_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>              grpc_server_;
  int                                          port_ = 0;
};

} // namespace mirrorsync::runtime
