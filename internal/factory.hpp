#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"

namespace analysis::broker {
class BrokerChannel;
class BackendChannel;
}
namespace analysis::pipeline {
class StageRegistry;
}
namespace analysis::worker {
struct PipelineServices;
class WorkerPool;
}

namespace analysis::factory {

/*
  Application

  Owns all long-lived objects of a worker process.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<broker::BrokerChannel>     broker;
  std::shared_ptr<broker::BackendChannel>    backend;
  std::shared_ptr<pipeline::StageRegistry>   stages;
  std::shared_ptr<worker::PipelineServices>  services;
  std::shared_ptr<worker::WorkerPool>        pool;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the dependency graph from the runtime config; workers are
  created but not started.

  This is the composition root. It is the ONLY place allowed to know
  concrete repository and storage types.
*/
Application Build(const analysis::runtime::config::RuntimeConfig& config);

} // namespace analysis::factory
