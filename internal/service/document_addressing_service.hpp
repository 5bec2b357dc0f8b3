#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>

#include "internal/core/document_addressing.hpp"
#include "internal/model/document.hpp"
#include "internal/storage/object_store.hpp"

namespace docstore::service {

struct UploadRequest {
  std::shared_ptr<arrow::io::InputStream> content;
  int64_t                                 content_length = 0;

  std::string original_filename;
  std::string doc_cat_code;
  std::string doc_typ_code;
  std::string lang_code;
};

/*
  Stores, lists, fetches and deletes documents of a transaction.

  Stateless: every call derives its object keys from its arguments and
  goes straight to the injected store, so calls may run concurrently.
  Concurrent uploads of the same (transaction, category) are arbitrated
  by the store.

  Errors (internal/util/errors.hpp):
    std::invalid_argument  bad transaction id, category, filename or doc id
    UploadFailed           store or stream failure during upload (wraps cause)
    NotFound               document absent
    StoreUnavailable       backend fault on read
    MetadataCorrupt        listed object with missing or malformed metadata
*/
class DocumentAddressingService {
 public:
  explicit DocumentAddressingService(docstore::storage::ObjectStorePtr store, docstore::core::DocumentOptions options = {});

  /*
    Store the document under its derived key. Re-uploading the same
    category of a transaction overwrites the previous document.

    The returned record is built from the request, not read back.
  */
  model::DocumentRecord UploadDocument(const std::string& transaction_id, const UploadRequest& request);

  /*
    Records of every document of the transaction, in store listing order.
    A corrupt record aborts the call or is skipped, per listing policy.
  */
  std::vector<model::DocumentRecord> FetchAllDocumentsMetadata(const std::string& transaction_id);

  // Bytes exactly as uploaded.
  std::shared_ptr<arrow::Buffer> FetchDocumentByDocId(const std::string& transaction_id, const std::string& document_id);

  /*
    One entry per stored object with its record and bytes. Objects whose
    records compare equal are all kept.
  */
  std::vector<model::DocumentWithContent> GetDocumentsWithMetadata(const std::string& transaction_id);

  // Never throws for a missing document: absence reports FAILURE.
  model::DeletionResult DeleteDocument(const std::string& transaction_id, const std::string& document_id);

  std::string DocumentId(const std::string& transaction_id, const std::string& doc_cat_code) const;

  const docstore::core::DocumentOptions& options() const {
    return options_;
  }

 private:
  model::DocumentRecord ReadRecord(const std::string& transaction_id, const std::string& object_name);

  // nullopt when a corrupt record is skipped
  std::optional<model::DocumentRecord> FetchRecord(const std::string& transaction_id, const std::string& object_name);

  docstore::storage::ObjectStorePtr store_;
  docstore::core::DocumentOptions   options_;
};

} // namespace docstore::service
