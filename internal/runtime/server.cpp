#include "server.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace analysis::runtime {

using observability::IntField;
using observability::StringField;

Server::Server(const config::ServerConfig& config, std::vector<std::unique_ptr<::grpc::Service>> services)
    : config_(config), services_(std::move(services)) {
  if (config_.bind_address().empty()) {
    throw util::InvalidState("server: empty bind_address");
  }
}

Server::~Server() {
  Stop();
}

int Server::Start() {
  if (grpc_server_) {
    throw util::InvalidState("server: already listening on " + config_.bind_address());
  }

  int                   port = 0;
  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(config_.bind_address(), ::grpc::InsecureServerCredentials(), &port);
  if (config_.max_receive_message_bytes() > 0) {
    builder.SetMaxReceiveMessageSize(static_cast<int>(config_.max_receive_message_bytes()));
  }
  for (const auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || port == 0) {
    grpc_server_.reset();
    throw util::InvalidState("server: cannot listen on " + config_.bind_address());
  }

  ANALYSIS_LOG_INFO("broker endpoint listening", {StringField("bind_address", config_.bind_address()), IntField("port", port),
                                                  IntField("services", static_cast<int64_t>(services_.size()))});
  return port;
}

void Server::Stop() {
  if (!grpc_server_) {
    return;
  }
  const auto deadline = std::chrono::system_clock::now() + std::chrono::milliseconds(config_.shutdown_grace_ms());
  grpc_server_->Shutdown(deadline);
  grpc_server_.reset();
  ANALYSIS_LOG_INFO("broker endpoint stopped", {StringField("bind_address", config_.bind_address())});
}

} // namespace analysis::runtime
