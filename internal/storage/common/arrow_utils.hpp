#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <memory>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace analysis::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw util::TransientInfraError
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw util::TransientInfraError(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::TransientInfraError(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

inline std::shared_ptr<arrow::Buffer> ToBuffer(std::string bytes) {
  return arrow::Buffer::FromString(std::move(bytes));
}

inline std::string ToBytes(const std::shared_ptr<arrow::Buffer>& buffer) {
  return buffer ? buffer->ToString() : std::string();
}

/*
  Builds the object-tier filesystem.

  LOCAL  → arrow::fs::LocalFileSystem rooted at root_path
  S3     → arrow::fs::S3FileSystem from S3Options (credentials, endpoint)
  AUTO   → URI ("s3://bucket/prefix", "file:///...") or plain local path
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const analysis::runtime::config::ObjectStorageConfig& config);

} // namespace analysis::storage::common
