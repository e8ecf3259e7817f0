#pragma once

#include <cstdint>
#include <string>

namespace analysis::db::model {

// Serialized ResultRecord keyed by (channel, task_id).
struct ResultRow {
  std::string channel;
  std::string task_id;
  std::string task_name;
  int         status   = 0;
  bool        terminal = false;
  std::string record;
  uint64_t    completed_at_ms = 0;
};

} // namespace analysis::db::model
