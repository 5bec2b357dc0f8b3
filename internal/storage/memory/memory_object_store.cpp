#include "memory_object_store.hpp"

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace docstore::storage {

using namespace docstore::storage::common;
using docstore::util::NotFound;
using docstore::util::StoreWriteError;

/*
  Content is drained before the map is locked so a failing stream leaves
  the previous object untouched.
*/
void MemoryObjectStore::Put(const std::string& key, const std::shared_ptr<arrow::io::InputStream>& content, int64_t content_length,
                            const model::ObjectMetadata& metadata) {
  ValidateObjectKey(key);
  if (content_length < 0) {
    throw std::invalid_argument("content length must not be negative");
  }

  auto buffer = Unwrap<StoreWriteError>(ReadExactly(content, content_length), "put " + key);

  std::unique_lock lock(mutex_);
  objects_[key] = StoredObject{std::move(buffer), metadata};
}

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> MemoryObjectStore::Get(const std::string& key) {
  ValidateObjectKey(key);

  std::shared_lock lock(mutex_);
  auto             it = objects_.find(key);
  if (it == objects_.end()) throw NotFound("object not found: " + key);

  return it->second.content;
}

model::ObjectMetadata MemoryObjectStore::GetMetadata(const std::string& key) {
  ValidateObjectKey(key);

  std::shared_lock lock(mutex_);
  auto             it = objects_.find(key);
  if (it == objects_.end()) throw NotFound("object not found: " + key);

  return it->second.metadata;
}

std::vector<std::string> MemoryObjectStore::List(const std::string& prefix) {
  ValidatePathComponent("list prefix", prefix);
  const auto scope = prefix + "/";

  std::vector<std::string> names;

  std::shared_lock lock(mutex_);
  for (auto it = objects_.lower_bound(scope); it != objects_.end(); ++it) {
    const auto& key = it->first;
    if (key.compare(0, scope.size(), scope) != 0) break;

    auto name = key.substr(scope.size());
    if (name.find('/') == std::string::npos) names.push_back(std::move(name));
  }
  return names;
}

bool MemoryObjectStore::Delete(const std::string& key) {
  ValidateObjectKey(key);

  std::unique_lock lock(mutex_);
  return objects_.erase(key) > 0;
}

size_t MemoryObjectStore::Size() const {
  std::shared_lock lock(mutex_);
  return objects_.size();
}

} // namespace docstore::storage
