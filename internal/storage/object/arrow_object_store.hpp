#pragma once

#include <memory>
#include <string>
#include <vector>

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>

#include "internal/storage/object_store.hpp"

namespace docstore::storage {

/*
  Object store over an Arrow filesystem (local disk, S3 / MinIO).

  Layout under root_path:

      content/<transaction>/<document>          object bytes
      metadata/<transaction>/<document>.pb      ObjectMetadata sidecar
      staging/<uuid>                            in-flight writes

  Arrow filesystems do not carry arbitrary user metadata, so metadata
  lives in a protobuf sidecar.

  Writes:
    - content and sidecar are staged, then moved into place
    - sidecar is committed before content, so a new object is never
      listed without its metadata
    - staged files are discarded on failure
    - if the content commit fails, the previous sidecar is restored (or
      the new one removed), so an overwrite is all-or-nothing
*/

class ArrowObjectStore final : public ObjectStore {
 public:
  ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  void Put(const std::string& key, const std::shared_ptr<arrow::io::InputStream>& content, int64_t content_length,
           const model::ObjectMetadata& metadata) override;

  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override;

  model::ObjectMetadata GetMetadata(const std::string& key) override;

  std::vector<std::string> List(const std::string& prefix) override;

  bool Delete(const std::string& key) override;

 private:
  std::string ContentPath(const std::string& key) const;
  std::string MetadataPath(const std::string& key) const;
  std::string StagingPath() const;

  // Throws NotFound unless path is an existing file.
  arrow::fs::FileInfo RequireFile(const std::string& path, const std::string& key);

  void EnsureParentDir(const std::string& path);

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
};

} // namespace docstore::storage
