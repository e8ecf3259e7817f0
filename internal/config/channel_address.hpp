#pragma once

#include <cstdint>
#include <string>

namespace analysis::config {

/*
  scheme://host:port/N

  N is the numeric namespace (database/partition index). Two channels
  collide when host, port and namespace are all equal.
*/
struct ChannelAddress {
  std::string scheme;
  std::string host;
  uint32_t    port           = 0;
  uint32_t    namespace_index = 0;

  // Stable channel identifier used as the storage partition key.
  std::string NamespaceKey() const;

  bool SameNamespace(const ChannelAddress& other) const {
    return host == other.host && port == other.port && namespace_index == other.namespace_index;
  }
};

ChannelAddress ParseChannelAddress(const std::string& url);

} // namespace analysis::config
