#include "storage_factory.hpp"

#include "cache/ram_cache_store.hpp"
#include "common/arrow_utils.hpp"
#include "internal/config/channel_address.hpp"
#include "object/object_arrow_store.hpp"

namespace analysis::storage {

StorageTiers StorageFactory::Build(const analysis::runtime::config::StorageConfig& cfg) {
  StorageTiers tiers;

  auto [object_fs, object_root] = common::Unwrap(common::ResolveFileSystem(cfg.object()));
  tiers.durable                 = std::make_shared<ObjectArrowStore>(std::move(object_fs), std::move(object_root));

  const auto cache_address = config::ParseChannelAddress(cfg.cache().address());
  tiers.cache              = std::make_shared<RamCacheStore>(cache_address.namespace_index);

  return tiers;
}

} // namespace analysis::storage
