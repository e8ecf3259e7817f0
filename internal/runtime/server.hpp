#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace analysis::runtime {

/*
  Producer-facing gRPC endpoint. Owns the registered services for the
  lifetime of the listener; Stop() gives in-flight calls the configured
  grace period and then cancels them.
*/
class Server {
public:
  Server(const config::ServerConfig& config, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  // Returns the bound port; a ":0" bind address picks a free one.
  int  Start();
  void Stop();

  bool Running() const { return grpc_server_ != nullptr; }

private:
  config::ServerConfig                          config_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
};

} // namespace analysis::runtime
