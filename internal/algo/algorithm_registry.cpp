#include "algorithm_registry.hpp"

#include "base_algo.hpp"
#include "internal/util/errors.hpp"

namespace analysis::algo {

std::shared_ptr<AlgorithmRegistry> AlgorithmRegistry::WithDefaults() {
  auto registry = std::make_shared<AlgorithmRegistry>();
  registry->Register(BaseAlgo::kName, [] { return std::make_unique<BaseAlgo>(); });
  return registry;
}

void AlgorithmRegistry::Register(const std::string& name, Factory factory) {
  if (name.empty() || !factory) {
    throw util::InvalidState("algorithm registration requires a name and a factory");
  }
  std::lock_guard lock(mutex_);
  factories_[name] = std::move(factory);
}

std::unique_ptr<Algorithm> AlgorithmRegistry::Create(const std::string& name) const {
  Factory factory;
  {
    std::lock_guard lock(mutex_);
    auto            it = factories_.find(name);
    if (it == factories_.end()) {
      throw util::InvalidPayload("unknown algorithm: " + name);
    }
    factory = it->second;
  }
  auto algorithm = factory();
  if (!algorithm) {
    throw util::AlgorithmError("algorithm factory for " + name + " returned null");
  }
  return algorithm;
}

bool AlgorithmRegistry::Contains(const std::string& name) const {
  std::lock_guard lock(mutex_);
  return factories_.contains(name);
}

std::vector<std::string> AlgorithmRegistry::Names() const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> names;
  names.reserve(factories_.size());
  for (const auto& [name, _] : factories_) {
    names.push_back(name);
  }
  return names;
}

} // namespace analysis::algo
