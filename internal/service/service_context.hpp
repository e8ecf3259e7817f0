#pragma once

#include <memory>

namespace analysis::broker {
class BrokerChannel;
class BackendChannel;
}

namespace analysis::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<analysis::broker::BrokerChannel>  broker;
  std::shared_ptr<analysis::broker::BackendChannel> backend;
};

}
