#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <arrow/buffer.h>

#include "internal/storage/object_store.hpp"

namespace docstore::storage {

/*
  In-memory object store.

  Backed by an ordered map of Arrow buffers; listing is lexicographic.
  Used for tests and ephemeral deployments.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class MemoryObjectStore final : public ObjectStore {
 public:
  MemoryObjectStore()           = default;
  ~MemoryObjectStore() override = default;

  void Put(const std::string& key, const std::shared_ptr<arrow::io::InputStream>& content, int64_t content_length,
           const model::ObjectMetadata& metadata) override;

  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override;

  model::ObjectMetadata GetMetadata(const std::string& key) override;

  std::vector<std::string> List(const std::string& prefix) override;

  bool Delete(const std::string& key) override;

  size_t Size() const;

 private:
  struct StoredObject {
    std::shared_ptr<arrow::Buffer> content;
    model::ObjectMetadata          metadata;
  };

  mutable std::shared_mutex           mutex_;
  std::map<std::string, StoredObject> objects_;
};

} // namespace docstore::storage
