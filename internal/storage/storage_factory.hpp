#pragma once

#include "config/config.pb.h"
#include "storage_backend.hpp"

namespace analysis::storage {

struct StorageTiers {
  StorageBackendPtr durable;
  StorageBackendPtr cache;
};

/*
  Builds both tier backends from configuration.

      auto tiers = StorageFactory::Build(config.storage());
      DatasetStore store(tiers.durable, tiers.cache, options);
*/

class StorageFactory {
public:
  static StorageTiers Build(const analysis::runtime::config::StorageConfig& cfg);
};

} // namespace analysis::storage
