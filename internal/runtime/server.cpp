#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace mirrorsync::runtime {

Server::Server(std::string bind_address, std::vector<std::shared_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &port_);

  for (const auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("start server: cannot listen on " + bind_address_ + "; check the address and that the port is free");
  }

  MIRRORSYNC_LOG_INFO("listening", {observability::StringField("address", bind_address_), observability::IntField("port", port_)});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
  }
}

std::shared_ptr<::grpc::Channel> Server::InProcessChannel() {
  if (!grpc_server_) throw std::runtime_error("in-process channel: server is not started");
  return grpc_server_->InProcessChannel(::grpc::ChannelArguments{});
}

} // namespace mirrorsync::runtime
