#pragma once

#include <string>

#include "analysis/engine/v1/dataset.pb.h"
#include "internal/util/errors.hpp"

namespace analysis::storage::common {

inline void ValidateBucket(const std::string& bucket) {
  if (bucket.empty()) {
    throw util::InvalidPayload("bucket must not be empty");
  }
  for (char c : bucket) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::InvalidPayload("bucket contains invalid character: " + bucket);
    }
  }
  if (bucket == "." || bucket == "..") {
    throw util::InvalidPayload("bucket must not be a relative path component");
  }
}

/*
  Keys may contain '/' separated segments (versioned copies live under
  "<key>.versions/<digest>"), but no empty, "." or ".." segment.
*/
inline void ValidateKey(const std::string& key) {
  if (key.empty()) {
    throw util::InvalidPayload("dataset key must not be empty");
  }

  std::string::size_type start = 0;
  while (start <= key.size()) {
    const auto end     = key.find('/', start);
    const auto segment = key.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (segment.empty() || segment == "." || segment == "..") {
      throw util::InvalidPayload("dataset key has an invalid segment: " + key);
    }
    for (char c : segment) {
      if (c == '\\' || c == '\0') {
        throw util::InvalidPayload("dataset key contains invalid character: " + key);
      }
    }
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
}

inline void ValidateDatasetKey(const engine::v1::DatasetKey& key) {
  ValidateBucket(key.bucket());
  ValidateKey(key.key());
}

inline std::string JoinPath(const std::string& root, const std::string& relative) {
  if (root.empty()) {
    return relative;
  }
  if (root.back() == '/') {
    return root + relative;
  }
  return root + "/" + relative;
}

// <bucket>/<key>
inline std::string RelativePath(const engine::v1::DatasetKey& key) {
  ValidateDatasetKey(key);
  return key.bucket() + "/" + key.key();
}

inline std::string Describe(const engine::v1::DatasetKey& key) {
  return key.bucket() + "/" + key.key();
}

} // namespace analysis::storage::common
