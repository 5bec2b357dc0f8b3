#pragma once

#include "config/config.pb.h"
#include "object_store.hpp"

namespace docstore::storage {

/*
  Builds the configured object store.

      STORE_KIND_MEMORY      -> MemoryObjectStore
      STORE_KIND_FILESYSTEM  -> ArrowObjectStore over the filesystem
                                resolved from root_path
*/

class StoreFactory {
 public:
  static ObjectStorePtr Build(const docstore::runtime::config::StorageConfig& cfg);
};

} // namespace docstore::storage
