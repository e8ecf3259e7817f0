#include "object_arrow_store.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace analysis::storage {

using namespace analysis::storage::common;
using engine::v1::DatasetKey;

ObjectArrowStore::ObjectArrowStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)) {
}

std::string ObjectArrowStore::ObjectPath(const DatasetKey& key) const {
  return JoinPath(root_path_, RelativePath(key));
}

/*
  Download full object
*/
std::shared_ptr<arrow::Buffer> ObjectArrowStore::Read(const DatasetKey& key) {
  const auto path = ObjectPath(key);
  auto       info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() == arrow::fs::FileType::NotFound) {
    throw util::NotFound("object not found: " + Describe(key));
  }
  return ReadAll(Unwrap(fs_->OpenInputFile(path)));
}

bool ObjectArrowStore::Exists(const DatasetKey& key) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(key)));
  return info.type() == arrow::fs::FileType::File;
}

/*
  Upload buffer as object.

  Parent "directories" are created first; on S3 this is a no-op or a
  bucket creation depending on allow_bucket_creation.

  Replacing an object is atomic for readers:
      local:  write <path>.tmp-<id> -> close -> rename over <path>
      S3:     single PUT (already all-or-nothing; Move would copy)
*/
void ObjectArrowStore::Write(const DatasetKey& key, const std::shared_ptr<arrow::Buffer>& buffer, const WriteOptions& /*options*/) {
  const auto path   = ObjectPath(key);
  const auto parent = path.substr(0, path.find_last_of('/'));
  if (!parent.empty() && parent != path) {
    Unwrap(fs_->CreateDir(parent, /*recursive=*/true));
  }

  if (fs_->type_name() == "s3") {
    WriteStream(path, *buffer);
    return;
  }

  // unique per write: two publishes of one version digest may race
  const auto tmp_path = path + ".tmp-" + util::GenerateUUIDString();
  try {
    WriteStream(tmp_path, *buffer);
    Unwrap(fs_->Move(tmp_path, path));
  } catch (const util::TransientInfraError&) {
    const auto cleanup = fs_->DeleteFile(tmp_path);
    if (!cleanup.ok()) {
      ANALYSIS_LOG_DEBUG("temporary object not removed", {observability::StringField("path", tmp_path), observability::StringField("error", cleanup.ToString())});
    }
    throw;
  }
}

void ObjectArrowStore::WriteStream(const std::string& path, const arrow::Buffer& buffer) {
  auto out = Unwrap(fs_->OpenOutputStream(path));
  Unwrap(out->Write(buffer.data(), buffer.size()));
  Unwrap(out->Close());
}

/*
  Delete object
*/
void ObjectArrowStore::Remove(const DatasetKey& key) {
  const auto path = ObjectPath(key);
  auto       info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() == arrow::fs::FileType::NotFound) {
    return;
  }
  Unwrap(fs_->DeleteFile(path));
}

} // namespace analysis::storage
