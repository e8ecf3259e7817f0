#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "algorithm.hpp"

namespace analysis::algo {

/*
  Name -> algorithm factory. A fresh instance is created per execution.
*/
class AlgorithmRegistry {
 public:
  using Factory = std::function<std::unique_ptr<Algorithm>()>;

  // Registry preloaded with "base".
  static std::shared_ptr<AlgorithmRegistry> WithDefaults();

  // Replaces an existing registration with the same name.
  void Register(const std::string& name, Factory factory);

  // Throws util::InvalidPayload for unknown names.
  std::unique_ptr<Algorithm> Create(const std::string& name) const;

  bool                     Contains(const std::string& name) const;
  std::vector<std::string> Names() const;

 private:
  mutable std::mutex             mutex_;
  std::map<std::string, Factory> factories_;
};

} // namespace analysis::algo
