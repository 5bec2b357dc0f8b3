#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/service/document_addressing_service.hpp"
#include "internal/storage/object_store.hpp"

namespace docstore::factory {

/*
  Application

  Owns the long-lived objects built from runtime config.
*/
struct Application {
  std::shared_ptr<docstore::storage::ObjectStore>                store;
  std::shared_ptr<docstore::service::DocumentAddressingService> documents;
};

/*
  Build

  Composition root: the only place that picks a concrete store.
*/
Application Build(const docstore::runtime::config::RuntimeConfig& config);

} // namespace docstore::factory
