#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/document.hpp"

namespace docstore::storage {

/*
  Object store abstraction.

  Objects are addressed by slash-separated keys and carry a flat
  key/value metadata map that can be read without the content.
  Content is always handled as Arrow buffers and streams.

  Implementations:
    MEMORY      -> ordered map of Arrow buffers
    FILESYSTEM  -> any Arrow filesystem (local, S3 / MinIO)

  Errors (internal/util/errors.hpp):
    NotFound        key absent on a read
    StoreReadError  backend fault while reading
    StoreWriteError backend fault, or a stream shorter or longer than
                    content_length, while writing
*/

class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  // ------------------------------------------------------------------
  // Put
  // ------------------------------------------------------------------
  /*
    Store content_length bytes read from content under key, replacing
    any existing object and its metadata.

    All-or-nothing as far as Get/GetMetadata/List can observe.
  */
  virtual void Put(const std::string& key, const std::shared_ptr<arrow::io::InputStream>& content, int64_t content_length,
                   const model::ObjectMetadata& metadata) = 0;

  // ------------------------------------------------------------------
  // Get
  // ------------------------------------------------------------------
  virtual std::shared_ptr<arrow::Buffer> Get(const std::string& key) = 0;

  // ------------------------------------------------------------------
  // GetMetadata
  // ------------------------------------------------------------------
  virtual model::ObjectMetadata GetMetadata(const std::string& key) = 0;

  // ------------------------------------------------------------------
  // List
  // ------------------------------------------------------------------
  /*
    Names of the objects stored directly under "<prefix>/".

    Order is defined by the implementation.
  */
  virtual std::vector<std::string> List(const std::string& prefix) = 0;

  // ------------------------------------------------------------------
  // Delete
  // ------------------------------------------------------------------
  /*
    true if the object existed and was removed. A missing object and a
    failed removal both return false.
  */
  virtual bool Delete(const std::string& key) = 0;
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

} // namespace docstore::storage
