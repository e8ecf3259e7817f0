#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "analysis/engine/v1/broker_service.grpc.pb.h"
#include "internal/service/broker_service.hpp"

namespace analysis::grpc {

class BrokerServer final : public analysis::engine::v1::TaskBrokerService::Service {
public:
  explicit BrokerServer(std::shared_ptr<analysis::service::BrokerService> svc);

  ::grpc::Status Enqueue(::grpc::ServerContext*,
                         const analysis::engine::v1::EnqueueRequest*,
                         analysis::engine::v1::EnqueueResponse*) override;

  ::grpc::Status GetResult(::grpc::ServerContext*,
                           const analysis::engine::v1::GetResultRequest*,
                           analysis::engine::v1::GetResultResponse*) override;

  ::grpc::Status GetStats(::grpc::ServerContext*,
                          const analysis::engine::v1::GetStatsRequest*,
                          analysis::engine::v1::GetStatsResponse*) override;

private:
  std::shared_ptr<analysis::service::BrokerService> service_;
};

}
