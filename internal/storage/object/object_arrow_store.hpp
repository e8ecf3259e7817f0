#pragma once

#include <memory>
#include <string>

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>

#include "internal/storage/storage_backend.hpp"

namespace analysis::storage {

/*
  Durable object tier using an Arrow filesystem (local, S3 / MinIO).

  Layout:
      <root_path>/<bucket>/<key>

  Characteristics:
    - whole-object writes; readers see the old or the new object, never a prefix
    - authoritative copy; never removed by cache operations
*/

class ObjectArrowStore final : public StorageBackend {
public:
  ObjectArrowStore(std::shared_ptr<arrow::fs::FileSystem> fs,
                   std::string root_path);

  std::shared_ptr<arrow::Buffer> Read(const engine::v1::DatasetKey& key) override;

  bool Exists(const engine::v1::DatasetKey& key) override;

  void Write(const engine::v1::DatasetKey& key,
             const std::shared_ptr<arrow::Buffer>& buffer,
             const WriteOptions& options) override;

  void Remove(const engine::v1::DatasetKey& key) override;

  Tier TierType() const override {
    return Tier::kObject;
  }

private:
  std::string ObjectPath(const engine::v1::DatasetKey& key) const;
  void        WriteStream(const std::string& path, const arrow::Buffer& buffer);

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string root_path_;
};

}
