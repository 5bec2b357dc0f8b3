#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace docstore::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw Error(context, cause)

  Error is one of the wrapping store errors; the Arrow status becomes the
  attached cause.
*/
template <typename Error, typename T>
T Unwrap(arrow::Result<T> result, const std::string& context) {
  if (!result.ok()) {
    throw Error(context, std::make_exception_ptr(std::runtime_error(result.status().ToString())));
  }
  return std::move(result).ValueOrDie();
}

template <typename Error>
void Unwrap(const arrow::Status& status, const std::string& context) {
  if (!status.ok()) {
    throw Error(context, std::make_exception_ptr(std::runtime_error(status.ToString())));
  }
}

/*
  Read exactly expected_size bytes; the stream must end there. A shorter
  or longer stream is an IOError.
*/
arrow::Result<std::shared_ptr<arrow::Buffer>> ReadExactly(const std::shared_ptr<arrow::io::InputStream>& input, int64_t expected_size);

/*
  Copy exactly size bytes from input to output in bounded chunks. The
  input must end after size bytes.
*/
arrow::Status CopyStream(const std::shared_ptr<arrow::io::InputStream>& input, const std::shared_ptr<arrow::io::OutputStream>& output,
                         int64_t size);

/*
  Resolve the filesystem and the root path inside it from storage config.

      /var/lib/docstore          -> LocalFileSystem, "/var/lib/docstore"
      s3://bucket/documents      -> S3FileSystem,    "bucket/documents"
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const docstore::runtime::config::StorageConfig& storage_config);

} // namespace docstore::storage::common
