#include "store_factory.hpp"

#include <memory>
#include <stdexcept>

#include "common/arrow_utils.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "memory/memory_object_store.hpp"
#include "object/arrow_object_store.hpp"

namespace docstore::storage {

using docstore::observability::StringField;

ObjectStorePtr StoreFactory::Build(const docstore::runtime::config::StorageConfig& cfg) {
  switch (cfg.kind()) {
    case docstore::runtime::config::STORE_KIND_FILESYSTEM: {
      auto [fs, root] = common::Unwrap<docstore::util::StoreUnavailable>(common::ResolveFileSystem(cfg), "resolve filesystem " + cfg.root_path());
      DOCSTORE_LOG_INFO("using filesystem object store", {StringField("filesystem", fs->type_name()), StringField("root", root)});
      return std::make_shared<ArrowObjectStore>(std::move(fs), std::move(root));
    }

    case docstore::runtime::config::STORE_KIND_MEMORY:
      DOCSTORE_LOG_INFO("using in-memory object store");
      return std::make_shared<MemoryObjectStore>();

    default:
      throw std::invalid_argument("unsupported storage kind: " + docstore::runtime::config::StoreKind_Name(cfg.kind()));
  }
}

} // namespace docstore::storage
