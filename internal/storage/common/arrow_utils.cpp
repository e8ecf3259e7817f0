#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

namespace analysis::storage::common {

namespace {

arrow::Result<std::shared_ptr<arrow::fs::FileSystem>> MakeS3FileSystem(const analysis::runtime::config::S3Options& proto_options) {
  ARROW_RETURN_NOT_OK(arrow::fs::EnsureS3Initialized());

  auto options = arrow::fs::S3Options::Defaults();
  if (!proto_options.access_key().empty()) {
    options.ConfigureAccessKey(proto_options.access_key(), proto_options.secret_key());
  }
  if (!proto_options.region().empty()) {
    options.region = proto_options.region();
  }
  if (!proto_options.endpoint_override().empty()) {
    options.endpoint_override = proto_options.endpoint_override();
  }
  if (!proto_options.scheme().empty()) {
    options.scheme = proto_options.scheme();
  }
  options.allow_bucket_creation = proto_options.allow_bucket_creation();

  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
  return std::static_pointer_cast<arrow::fs::FileSystem>(fs);
}

} // namespace

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const analysis::runtime::config::ObjectStorageConfig& config) {
  std::string resolved_path = config.root_path();

  switch (config.filesystem()) {
    case analysis::runtime::config::FILE_SYSTEM_LOCAL:
      return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::make_shared<arrow::fs::LocalFileSystem>()), resolved_path);

    case analysis::runtime::config::FILE_SYSTEM_S3: {
      // "s3://bucket/prefix" and bare "bucket/prefix" are both accepted
      if (resolved_path.rfind("s3://", 0) == 0) {
        resolved_path = resolved_path.substr(5);
      }
      ARROW_ASSIGN_OR_RAISE(auto fs, MakeS3FileSystem(config.s3()));
      return std::make_pair(std::move(fs), resolved_path);
    }

    case analysis::runtime::config::FILE_SYSTEM_AUTO:
    default: {
      if (resolved_path.rfind("s3://", 0) == 0 && (!config.s3().access_key().empty() || !config.s3().endpoint_override().empty())) {
        resolved_path = resolved_path.substr(5);
        ARROW_ASSIGN_OR_RAISE(auto fs, MakeS3FileSystem(config.s3()));
        return std::make_pair(std::move(fs), resolved_path);
      }
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(resolved_path, &resolved_path));
      return std::make_pair(std::move(fs), resolved_path);
    }
  }
}

} // namespace analysis::storage::common
