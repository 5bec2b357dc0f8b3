#include "document_addressing_service.hpp"

#include <exception>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace docstore::service {

using docstore::observability::IntField;
using docstore::observability::StringField;
using docstore::util::MetadataCorrupt;
using docstore::util::NotFound;
using docstore::util::UploadFailed;

namespace {

constexpr char kDeletionSuccessMessage[] = "Document deleted successfully";
constexpr char kDeletionFailureMessage[] = "Document deletion failed";

template <typename Fn>
auto ObserveCall(std::string_view route, const std::string& transaction_id, Fn&& fn) {
  try {
    return fn();
  } catch (const std::exception& ex) {
    DOCSTORE_LOG_ERROR("document operation failed",
                       {StringField("route", route), StringField("transaction_id", transaction_id), StringField("error", ex.what())});
    throw;
  }
}

} // namespace

DocumentAddressingService::DocumentAddressingService(docstore::storage::ObjectStorePtr store, docstore::core::DocumentOptions options)
    : store_(std::move(store)), options_(std::move(options)) {
  if (!store_) {
    throw std::invalid_argument("document service requires an object store");
  }
}

std::string DocumentAddressingService::DocumentId(const std::string& transaction_id, const std::string& doc_cat_code) const {
  return docstore::core::DeriveDocumentId(options_.id_namespace, transaction_id, doc_cat_code);
}

model::DocumentRecord DocumentAddressingService::UploadDocument(const std::string& transaction_id, const UploadRequest& request) {
  return ObserveCall("DocumentService.UploadDocument", transaction_id, [&] {
    docstore::storage::common::ValidatePathComponent("transaction id", transaction_id);
    if (request.doc_cat_code.empty()) {
      throw std::invalid_argument("document category code must not be empty");
    }
    if (!request.content) {
      throw std::invalid_argument("document content stream is null");
    }
    if (request.content_length < 0) {
      throw std::invalid_argument("document content length must not be negative");
    }

    auto format = docstore::core::DocumentFileFormat(request.original_filename, options_.format_rule);
    if (!format) {
      throw std::invalid_argument("document filename has no file format: " + request.original_filename);
    }

    const auto doc_id   = DocumentId(transaction_id, request.doc_cat_code);
    const auto key      = docstore::core::ObjectKey(transaction_id, doc_id);
    const auto metadata = docstore::core::BuildMetadata(doc_id, request.original_filename, request.doc_cat_code, request.doc_typ_code,
                                                        request.lang_code);

    try {
      store_->Put(key, request.content, request.content_length, metadata);
    } catch (const std::exception&) {
      throw UploadFailed("upload document " + key, std::current_exception());
    }

    DOCSTORE_LOG_INFO("document uploaded", {StringField("key", key), StringField("doc_cat_code", request.doc_cat_code),
                                            IntField("size_bytes", request.content_length)});

    model::DocumentRecord record;
    record.transaction_id  = transaction_id;
    record.doc_id          = doc_id;
    record.doc_name        = request.original_filename;
    record.doc_cat_code    = request.doc_cat_code;
    record.doc_typ_code    = request.doc_typ_code;
    record.doc_file_format = std::move(*format);
    return record;
  });
}

/*
  A metadata read that finds nothing means the listed object has no
  usable metadata, which is corruption from the caller's point of view.
*/
model::DocumentRecord DocumentAddressingService::ReadRecord(const std::string& transaction_id, const std::string& object_name) {
  const auto key = docstore::core::ObjectKey(transaction_id, object_name);

  model::ObjectMetadata metadata;
  try {
    metadata = store_->GetMetadata(key);
  } catch (const NotFound& e) {
    throw MetadataCorrupt("metadata unavailable for listed object " + key + ": " + e.what());
  }

  return docstore::core::RecordFromMetadata(transaction_id, object_name, metadata, options_.format_rule);
}

std::optional<model::DocumentRecord> DocumentAddressingService::FetchRecord(const std::string& transaction_id, const std::string& object_name) {
  try {
    return ReadRecord(transaction_id, object_name);
  } catch (const MetadataCorrupt& e) {
    if (options_.listing_policy != docstore::runtime::config::LISTING_POLICY_SKIP_CORRUPT) {
      throw;
    }
    DOCSTORE_LOG_WARN("skipping document with corrupt metadata", {StringField("transaction_id", transaction_id),
                                                                  StringField("object", object_name), StringField("error", e.what())});
    return std::nullopt;
  }
}

std::vector<model::DocumentRecord> DocumentAddressingService::FetchAllDocumentsMetadata(const std::string& transaction_id) {
  return ObserveCall("DocumentService.FetchAllDocumentsMetadata", transaction_id, [&] {
    docstore::storage::common::ValidatePathComponent("transaction id", transaction_id);

    std::vector<model::DocumentRecord> records;
    for (const auto& object_name : store_->List(transaction_id)) {
      auto record = FetchRecord(transaction_id, object_name);
      if (record) records.push_back(std::move(*record));
    }
    return records;
  });
}

std::shared_ptr<arrow::Buffer> DocumentAddressingService::FetchDocumentByDocId(const std::string& transaction_id,
                                                                               const std::string& document_id) {
  return ObserveCall("DocumentService.FetchDocumentByDocId", transaction_id,
                     [&] { return store_->Get(docstore::core::ObjectKey(transaction_id, document_id)); });
}

std::vector<model::DocumentWithContent> DocumentAddressingService::GetDocumentsWithMetadata(const std::string& transaction_id) {
  return ObserveCall("DocumentService.GetDocumentsWithMetadata", transaction_id, [&] {
    docstore::storage::common::ValidatePathComponent("transaction id", transaction_id);

    std::vector<model::DocumentWithContent> documents;
    for (const auto& object_name : store_->List(transaction_id)) {
      auto record = FetchRecord(transaction_id, object_name);
      if (!record) continue;

      model::DocumentWithContent document;
      document.content = store_->Get(docstore::core::ObjectKey(transaction_id, object_name));
      document.record  = std::move(*record);
      documents.push_back(std::move(document));
    }
    return documents;
  });
}

model::DeletionResult DocumentAddressingService::DeleteDocument(const std::string& transaction_id, const std::string& document_id) {
  return ObserveCall("DocumentService.DeleteDocument", transaction_id, [&] {
    const auto key     = docstore::core::ObjectKey(transaction_id, document_id);
    const bool deleted = store_->Delete(key);

    DOCSTORE_LOG_INFO("document delete", {StringField("key", key), docstore::observability::BoolField("deleted", deleted)});

    model::DeletionResult result;
    if (deleted) {
      result.status  = model::DeletionStatus::kSuccess;
      result.message = kDeletionSuccessMessage;
    } else {
      result.status  = model::DeletionStatus::kFailure;
      result.message = kDeletionFailureMessage;
    }
    return result;
  });
}

} // namespace docstore::service
