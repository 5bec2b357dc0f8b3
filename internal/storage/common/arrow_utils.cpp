#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

#include <algorithm>

namespace docstore::storage::common {

namespace {

constexpr int64_t kCopyChunkBytes = 1 << 20;

arrow::Result<arrow::fs::S3Options> MakeS3Options(const std::string& root_path, const docstore::runtime::config::S3Options& proto_options,
                                                  std::string* resolved_path) {
  ARROW_ASSIGN_OR_RAISE(auto options, arrow::fs::S3Options::FromUri(root_path, resolved_path));

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
  if (proto_options.connect_timeout() > 0) {
    options.connect_timeout = proto_options.connect_timeout();
  }
  if (proto_options.request_timeout() > 0) {
    options.request_timeout = proto_options.request_timeout();
  }
  options.allow_bucket_creation = proto_options.allow_bucket_creation();
  return options;
}

// A stream longer than its declared length would otherwise be truncated silently.
arrow::Status ExpectEndOfStream(const std::shared_ptr<arrow::io::InputStream>& input, int64_t expected_size) {
  ARROW_ASSIGN_OR_RAISE(auto extra, input->Read(1));
  if (extra->size() != 0) {
    return arrow::Status::IOError("stream longer than declared length of ", expected_size, " bytes");
  }
  return arrow::Status::OK();
}

} // namespace

arrow::Result<std::shared_ptr<arrow::Buffer>> ReadExactly(const std::shared_ptr<arrow::io::InputStream>& input, int64_t expected_size) {
  if (!input) {
    return arrow::Status::Invalid("content stream is null");
  }

  ARROW_ASSIGN_OR_RAISE(auto buffer, input->Read(expected_size));
  if (buffer->size() != expected_size) {
    return arrow::Status::IOError("short read: expected ", expected_size, " bytes, got ", buffer->size());
  }
  ARROW_RETURN_NOT_OK(ExpectEndOfStream(input, expected_size));
  return buffer;
}

arrow::Status CopyStream(const std::shared_ptr<arrow::io::InputStream>& input, const std::shared_ptr<arrow::io::OutputStream>& output,
                         int64_t size) {
  if (!input) {
    return arrow::Status::Invalid("content stream is null");
  }

  int64_t remaining = size;
  while (remaining > 0) {
    ARROW_ASSIGN_OR_RAISE(auto chunk, input->Read(std::min(remaining, kCopyChunkBytes)));
    if (chunk->size() == 0) {
      return arrow::Status::IOError("short read: ", remaining, " of ", size, " bytes missing");
    }
    ARROW_RETURN_NOT_OK(output->Write(chunk));
    remaining -= chunk->size();
  }
  return ExpectEndOfStream(input, size);
}

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const docstore::runtime::config::StorageConfig& storage_config) {
  const auto& root_path     = storage_config.root_path();
  std::string resolved_path = root_path;

  switch (storage_config.filesystem()) {
    case docstore::runtime::config::FILE_SYSTEM_LOCAL:
      return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::make_shared<arrow::fs::LocalFileSystem>()), resolved_path);

    case docstore::runtime::config::FILE_SYSTEM_S3: {
      ARROW_ASSIGN_OR_RAISE(auto options, MakeS3Options(root_path, storage_config.s3(), &resolved_path));
      ARROW_RETURN_NOT_OK(arrow::fs::EnsureS3Initialized());
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
      return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::move(fs)), resolved_path);
    }

    case docstore::runtime::config::FILE_SYSTEM_AUTO:
    default: {
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(root_path, &resolved_path));
      return std::make_pair(std::move(fs), resolved_path);
    }
  }
}

} // namespace docstore::storage::common
