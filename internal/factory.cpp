#include "factory.hpp"

#include "internal/core/document_addressing.hpp"
#include "internal/storage/store_factory.hpp"

namespace docstore::factory {

Application Build(const docstore::runtime::config::RuntimeConfig& config) {
  Application app;
  app.store     = docstore::storage::StoreFactory::Build(config.storage());
  app.documents = std::make_shared<docstore::service::DocumentAddressingService>(app.store,
                                                                                  docstore::core::FromConfig(config.documents()));
  return app;
}

} // namespace docstore::factory
