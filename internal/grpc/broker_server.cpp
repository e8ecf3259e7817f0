#include "broker_server.hpp"

#include "grpc_error.hpp"

namespace analysis::grpc {

using namespace analysis::engine::v1;

BrokerServer::BrokerServer(std::shared_ptr<analysis::service::BrokerService> svc) : service_(std::move(svc)) {
}

::grpc::Status BrokerServer::Enqueue(::grpc::ServerContext*, const EnqueueRequest* req, EnqueueResponse* resp) {
  try {
    *resp = service_->Enqueue(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BrokerServer::GetResult(::grpc::ServerContext*, const GetResultRequest* req, GetResultResponse* resp) {
  try {
    *resp = service_->GetResult(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BrokerServer::GetStats(::grpc::ServerContext*, const GetStatsRequest* req, GetStatsResponse* resp) {
  try {
    *resp = service_->GetStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace analysis::grpc
