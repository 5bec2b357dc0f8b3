#include "internal/service/document_addressing_service.hpp"

#include <arrow/io/memory.h>

#include <cassert>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/storage/memory/memory_object_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using docstore::core::DocumentOptions;
using docstore::model::DeletionStatus;
using docstore::model::DocumentRecord;
using docstore::service::DocumentAddressingService;
using docstore::service::UploadRequest;
using docstore::storage::MemoryObjectStore;
using docstore::storage::ObjectStore;

constexpr char kPassportId[] = "2e520fd6-ac40-548d-b56f-336eb2b6fdea"; // txn-123 + POA

std::shared_ptr<arrow::io::InputStream> StreamOf(const std::string& text) {
  return std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(text));
}

UploadRequest Request(const std::string& bytes, const std::string& filename, const std::string& cat, const std::string& typ = "RES",
                      const std::string& lang = "eng") {
  UploadRequest request;
  request.content           = StreamOf(bytes);
  request.content_length    = static_cast<int64_t>(bytes.size());
  request.original_filename = filename;
  request.doc_cat_code      = cat;
  request.doc_typ_code      = typ;
  request.lang_code         = lang;
  return request;
}

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

/*
  Store whose Put always fails, as a disconnected backend would.
*/
class FailingStore final : public ObjectStore {
 public:
  void Put(const std::string& key, const std::shared_ptr<arrow::io::InputStream>&, int64_t, const docstore::model::ObjectMetadata&) override {
    throw docstore::util::StoreWriteError("backend rejected " + key, std::make_exception_ptr(std::runtime_error("connection reset")));
  }
  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override {
    throw docstore::util::StoreReadError("backend unavailable for " + key);
  }
  docstore::model::ObjectMetadata GetMetadata(const std::string& key) override {
    throw docstore::util::StoreReadError("backend unavailable for " + key);
  }
  std::vector<std::string> List(const std::string&) override {
    return {};
  }
  bool Delete(const std::string&) override {
    return false;
  }
};

/*
  Lists a name whose metadata read reports NotFound.
*/
class MetadataLessStore final : public ObjectStore {
 public:
  explicit MetadataLessStore(std::shared_ptr<MemoryObjectStore> inner) : inner_(std::move(inner)) {
  }

  void Put(const std::string& key, const std::shared_ptr<arrow::io::InputStream>& content, int64_t length,
           const docstore::model::ObjectMetadata& metadata) override {
    inner_->Put(key, content, length, metadata);
  }
  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override {
    return inner_->Get(key);
  }
  docstore::model::ObjectMetadata GetMetadata(const std::string& key) override {
    if (key.substr(key.find('/') + 1) == "ghost") throw docstore::util::NotFound("metadata not found: " + key);
    return inner_->GetMetadata(key);
  }
  std::vector<std::string> List(const std::string& prefix) override {
    auto names = inner_->List(prefix);
    names.push_back("ghost");
    return names;
  }
  bool Delete(const std::string& key) override {
    return inner_->Delete(key);
  }

 private:
  std::shared_ptr<MemoryObjectStore> inner_;
};

void TestUploadReturnsRecordFromInputs() {
  auto                      store = std::make_shared<MemoryObjectStore>();
  DocumentAddressingService service(store);

  const auto record = service.UploadDocument("txn-123", Request("%PDF", "passport.pdf", "POA"));
  assert(record.transaction_id == "txn-123");
  assert(record.doc_id == kPassportId);
  assert(record.doc_name == "passport.pdf");
  assert(record.doc_cat_code == "POA");
  assert(record.doc_typ_code == "RES");
  assert(record.doc_file_format == "pdf");

  assert(service.DocumentId("txn-123", "POA") == kPassportId);
  assert(store->Get(std::string("txn-123/") + kPassportId)->ToString() == "%PDF");
}

void TestUploadWritesCompleteMetadata() {
  auto                      store = std::make_shared<MemoryObjectStore>();
  DocumentAddressingService service(store);

  (void)service.UploadDocument("txn-123", Request("%PDF", "passport.pdf", "POA"));

  const auto metadata = store->GetMetadata(std::string("txn-123/") + kPassportId);
  assert(metadata.size() == 5);
  assert(metadata.at("doccatcode") == "POA");
  assert(metadata.at("doctypcode") == "RES");
  assert(metadata.at("langcode") == "eng");
  assert(metadata.at("docname") == "passport.pdf");
  assert(metadata.at("docid") == kPassportId);
}

void TestRoundTrip() {
  DocumentAddressingService service(std::make_shared<MemoryObjectStore>());

  const auto uploaded = service.UploadDocument("txn-123", Request("passport bytes", "passport.pdf", "POA"));

  const auto records = service.FetchAllDocumentsMetadata("txn-123");
  assert(records.size() == 1);
  assert(records[0] == uploaded);

  assert(service.FetchDocumentByDocId("txn-123", uploaded.doc_id)->ToString() == "passport bytes");

  const auto documents = service.GetDocumentsWithMetadata("txn-123");
  assert(documents.size() == 1);
  assert(documents[0].record == uploaded);
  assert(documents[0].content->ToString() == "passport bytes");

  const auto deleted = service.DeleteDocument("txn-123", uploaded.doc_id);
  assert(deleted.status == DeletionStatus::kSuccess);
  assert(deleted.message == "Document deleted successfully");
  assert(service.FetchAllDocumentsMetadata("txn-123").empty());
}

void TestReuploadOverwrites() {
  auto                      store = std::make_shared<MemoryObjectStore>();
  DocumentAddressingService service(store);

  const auto first  = service.UploadDocument("txn-123", Request("old", "passport.pdf", "POA"));
  const auto second = service.UploadDocument("txn-123", Request("new", "passport-v2.png", "POA", "ID", "fra"));
  assert(first.doc_id == second.doc_id);
  assert(store->Size() == 1);

  const auto records = service.FetchAllDocumentsMetadata("txn-123");
  assert(records.size() == 1);
  assert(records[0] == second);
  assert(records[0].doc_file_format == "png");
  assert(service.FetchDocumentByDocId("txn-123", second.doc_id)->ToString() == "new");
}

void TestTransactionsAreIsolated() {
  DocumentAddressingService service(std::make_shared<MemoryObjectStore>());

  (void)service.UploadDocument("txn-1", Request("a", "a.pdf", "POA"));
  (void)service.UploadDocument("txn-1", Request("b", "b.pdf", "POI"));
  (void)service.UploadDocument("txn-10", Request("c", "c.pdf", "POA"));

  assert(service.FetchAllDocumentsMetadata("txn-1").size() == 2);
  assert(service.FetchAllDocumentsMetadata("txn-10").size() == 1);
  assert(service.FetchAllDocumentsMetadata("txn-2").empty());
  assert(service.GetDocumentsWithMetadata("txn-2").empty());
}

void TestFetchMissingDocumentIsNotFound() {
  DocumentAddressingService service(std::make_shared<MemoryObjectStore>());
  assert(Throws<docstore::util::NotFound>([&] { (void)service.FetchDocumentByDocId("txn-123", kPassportId); }));
}

void TestDeleteMissingDocumentReportsFailure() {
  DocumentAddressingService service(std::make_shared<MemoryObjectStore>());

  const auto result = service.DeleteDocument("txn-123", "does-not-exist");
  assert(result.status == DeletionStatus::kFailure);
  assert(result.message == "Document deletion failed");
  assert(docstore::model::ToString(result.status) == "FAILURE");
}

void TestInvalidArgumentsAreRejected() {
  auto                      store = std::make_shared<MemoryObjectStore>();
  DocumentAddressingService service(store);

  assert(Throws<std::invalid_argument>([&] { (void)service.UploadDocument("", Request("x", "a.pdf", "POA")); }));
  assert(Throws<std::invalid_argument>([&] { (void)service.UploadDocument("txn/1", Request("x", "a.pdf", "POA")); }));
  assert(Throws<std::invalid_argument>([&] { (void)service.UploadDocument("txn-1", Request("x", "a.pdf", "")); }));
  assert(Throws<std::invalid_argument>([&] { (void)service.UploadDocument("txn-1", Request("x", "README", "POA")); }));
  assert(Throws<std::invalid_argument>([&] { (void)service.UploadDocument("txn-1", Request("x", ".bashrc", "POA")); }));

  auto no_stream    = Request("x", "a.pdf", "POA");
  no_stream.content = nullptr;
  assert(Throws<std::invalid_argument>([&] { (void)service.UploadDocument("txn-1", no_stream); }));

  assert(Throws<std::invalid_argument>([&] { (void)service.FetchDocumentByDocId("txn-1", "../x"); }));
  assert(Throws<std::invalid_argument>([&] { (void)service.DeleteDocument("txn-1", ""); }));
  assert(Throws<std::invalid_argument>([&] { (void)service.FetchAllDocumentsMetadata(""); }));

  assert(store->Size() == 0);
  assert(Throws<std::invalid_argument>([] { (void)DocumentAddressingService(nullptr); }));
}

void TestUploadFailureWrapsCause() {
  DocumentAddressingService service(std::make_shared<FailingStore>());

  bool threw = false;
  try {
    (void)service.UploadDocument("txn-123", Request("x", "passport.pdf", "POA"));
  } catch (const docstore::util::UploadFailed& e) {
    threw = true;
    assert(std::string(e.what()).find("connection reset") != std::string::npos);
    assert(Throws<docstore::util::StoreWriteError>([&] { std::rethrow_exception(e.cause()); }));
  }
  assert(threw && "Store failures during upload must surface as UploadFailed.");
}

void TestShortStreamSurfacesAsUploadFailed() {
  auto                      store = std::make_shared<MemoryObjectStore>();
  DocumentAddressingService service(store);

  auto request           = Request("abc", "passport.pdf", "POA");
  request.content_length = 100;
  assert(Throws<docstore::util::UploadFailed>([&] { (void)service.UploadDocument("txn-123", request); }));
  assert(store->Size() == 0);

  auto truncated           = Request("abcdef", "passport.pdf", "POA");
  truncated.content_length = 3;
  assert(Throws<docstore::util::UploadFailed>([&] { (void)service.UploadDocument("txn-123", truncated); }));
  assert(store->Size() == 0);
}

void TestReadFaultIsStoreUnavailable() {
  DocumentAddressingService service(std::make_shared<FailingStore>());
  assert(Throws<docstore::util::StoreUnavailable>([&] { (void)service.FetchDocumentByDocId("txn-123", kPassportId); }));
}

void TestCorruptMetadataFailsFast() {
  auto                      store = std::make_shared<MemoryObjectStore>();
  DocumentAddressingService service(store);

  (void)service.UploadDocument("txn-1", Request("good", "a.pdf", "POA"));
  store->Put("txn-1/broken", StreamOf("bad"), 3, {{"docid", "broken"}, {"docname", "b.pdf"}});

  assert(Throws<docstore::util::MetadataCorrupt>([&] { (void)service.FetchAllDocumentsMetadata("txn-1"); }));
  assert(Throws<docstore::util::MetadataCorrupt>([&] { (void)service.GetDocumentsWithMetadata("txn-1"); }));
}

void TestCorruptMetadataIsSkippedWhenConfigured() {
  auto            store = std::make_shared<MemoryObjectStore>();
  DocumentOptions options;
  options.listing_policy = docstore::runtime::config::LISTING_POLICY_SKIP_CORRUPT;
  DocumentAddressingService service(store, options);

  const auto good = service.UploadDocument("txn-1", Request("good", "a.pdf", "POA"));
  store->Put("txn-1/broken", StreamOf("bad"), 3, {{"docid", "broken"}, {"docname", "b.pdf"}});

  const auto records = service.FetchAllDocumentsMetadata("txn-1");
  assert(records.size() == 1);
  assert(records[0] == good);

  const auto documents = service.GetDocumentsWithMetadata("txn-1");
  assert(documents.size() == 1);
  assert(documents[0].content->ToString() == "good");
}

void TestMissingMetadataIsCorrupt() {
  auto                      inner = std::make_shared<MemoryObjectStore>();
  DocumentAddressingService strict(std::make_shared<MetadataLessStore>(inner));
  (void)strict.UploadDocument("txn-1", Request("good", "a.pdf", "POA"));

  assert(Throws<docstore::util::MetadataCorrupt>([&] { (void)strict.FetchAllDocumentsMetadata("txn-1"); }));

  DocumentOptions options;
  options.listing_policy = docstore::runtime::config::LISTING_POLICY_SKIP_CORRUPT;
  DocumentAddressingService lenient(std::make_shared<MetadataLessStore>(inner), options);
  assert(lenient.FetchAllDocumentsMetadata("txn-1").size() == 1);
}

void TestAggregationKeepsOneEntryPerObject() {
  DocumentAddressingService service(std::make_shared<MemoryObjectStore>());

  // identical names, types and bytes under different categories
  (void)service.UploadDocument("txn-1", Request("same", "scan.pdf", "POA"));
  (void)service.UploadDocument("txn-1", Request("same", "scan.pdf", "POI"));
  (void)service.UploadDocument("txn-1", Request("same", "scan.pdf", "POR"));

  const auto documents = service.GetDocumentsWithMetadata("txn-1");
  assert(documents.size() == 3);
  for (const auto& document : documents) {
    assert(document.content->ToString() == "same");
    assert(document.record.doc_name == "scan.pdf");
    assert(document.record.doc_id == service.DocumentId("txn-1", document.record.doc_cat_code));
  }
}

void TestFormatRuleAppliesOnUploadAndListing() {
  DocumentOptions options;
  options.format_rule = docstore::runtime::config::FORMAT_RULE_LAST_DOT;
  DocumentAddressingService last_dot(std::make_shared<MemoryObjectStore>(), options);
  assert(last_dot.UploadDocument("txn-1", Request("x", "scan.final.png", "POA")).doc_file_format == "png");
  assert(last_dot.FetchAllDocumentsMetadata("txn-1")[0].doc_file_format == "png");

  DocumentAddressingService first_dot(std::make_shared<MemoryObjectStore>());
  assert(first_dot.UploadDocument("txn-1", Request("x", "scan.final.png", "POA")).doc_file_format == "final");
  assert(first_dot.FetchAllDocumentsMetadata("txn-1")[0].doc_file_format == "final");
}

void TestCustomNamespaceChangesIds() {
  DocumentOptions options;
  options.id_namespace = docstore::util::kNamespaceDns;
  DocumentAddressingService service(std::make_shared<MemoryObjectStore>(), options);

  const auto record = service.UploadDocument("txn-123", Request("x", "passport.pdf", "POA"));
  assert(record.doc_id != kPassportId);
  assert(record.doc_id == docstore::core::DeriveDocumentId(docstore::util::kNamespaceDns, "txn-123", "POA"));
  assert(service.FetchAllDocumentsMetadata("txn-123")[0] == record);
}

} // namespace

int main() {
  TestUploadReturnsRecordFromInputs();
  TestUploadWritesCompleteMetadata();
  TestRoundTrip();
  TestReuploadOverwrites();
  TestTransactionsAreIsolated();
  TestFetchMissingDocumentIsNotFound();
  TestDeleteMissingDocumentReportsFailure();
  TestInvalidArgumentsAreRejected();
  TestUploadFailureWrapsCause();
  TestShortStreamSurfacesAsUploadFailed();
  TestReadFaultIsStoreUnavailable();
  TestCorruptMetadataFailsFast();
  TestCorruptMetadataIsSkippedWhenConfigured();
  TestMissingMetadataIsCorrupt();
  TestAggregationKeepsOneEntryPerObject();
  TestFormatRuleAppliesOnUploadAndListing();
  TestCustomNamespaceChangesIds();

  std::cout << "docstore_unit_document_addressing_service: pass\n";
  return 0;
}
