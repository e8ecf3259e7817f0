#pragma once

#include "analysis/engine/v1/broker_service.pb.h"
#include "service_context.hpp"

namespace analysis::service {

/*
  Producer-facing operations: submit envelopes, poll results.
*/
class BrokerService {
public:
  explicit BrokerService(ServiceContext ctx);

  analysis::engine::v1::EnqueueResponse
  Enqueue(const analysis::engine::v1::EnqueueRequest& req);

  analysis::engine::v1::GetResultResponse
  GetResult(const analysis::engine::v1::GetResultRequest& req);

  analysis::engine::v1::GetStatsResponse
  GetStats(const analysis::engine::v1::GetStatsRequest& req);

private:
  ServiceContext ctx_;
};

}
