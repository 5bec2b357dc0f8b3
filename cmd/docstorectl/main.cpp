#include <arrow/io/file.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/document_addressing.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

using docstore::model::DocumentRecord;
using docstore::service::DocumentAddressingService;
using docstore::storage::common::Unwrap;
using docstore::util::StoreReadError;
using docstore::util::StoreWriteError;

static void Usage() {
  std::cout << "Usage:\n"
            << "  docstorectl --config <config.yaml> id <transaction_id> <doc_cat_code>\n"
            << "  docstorectl --config <config.yaml> upload <transaction_id> <file> <doc_cat_code> <doc_typ_code> <lang_code>\n"
            << "  docstorectl --config <config.yaml> list <transaction_id>\n"
            << "  docstorectl --config <config.yaml> fetch <transaction_id> <doc_id> <out_file>\n"
            << "  docstorectl --config <config.yaml> export <transaction_id> <out_dir>\n"
            << "  docstorectl --config <config.yaml> delete <transaction_id> <doc_id>\n";
}

static void PrintRecord(const DocumentRecord& record) {
  std::cout << record.transaction_id << '\t' << record.doc_id << '\t' << record.doc_name << '\t' << record.doc_cat_code << '\t'
            << record.doc_typ_code << '\t' << record.doc_file_format << '\n';
}

static void WriteFile(const std::string& path, const std::shared_ptr<arrow::Buffer>& content) {
  auto out = Unwrap<StoreWriteError>(arrow::io::FileOutputStream::Open(path), "open " + path);
  Unwrap<StoreWriteError>(out->Write(content), "write " + path);
  Unwrap<StoreWriteError>(out->Close(), "close " + path);
}

static int Run(DocumentAddressingService& documents, const std::string& cmd, const std::vector<std::string>& args) {
  if (cmd == "id") {
    if (args.size() != 2) return -1;
    std::cout << documents.DocumentId(args[0], args[1]) << '\n';
    return 0;
  }

  if (cmd == "upload") {
    if (args.size() != 5) return -1;

    auto file = Unwrap<StoreReadError>(arrow::io::ReadableFile::Open(args[1]), "open " + args[1]);

    docstore::service::UploadRequest req;
    req.content           = file;
    req.content_length    = Unwrap<StoreReadError>(file->GetSize(), "size " + args[1]);
    req.original_filename = std::filesystem::path(args[1]).filename().string();
    req.doc_cat_code      = args[2];
    req.doc_typ_code      = args[3];
    req.lang_code         = args[4];

    PrintRecord(documents.UploadDocument(args[0], req));
    return 0;
  }

  if (cmd == "list") {
    if (args.size() != 1) return -1;
    for (const auto& record : documents.FetchAllDocumentsMetadata(args[0])) {
      PrintRecord(record);
    }
    return 0;
  }

  if (cmd == "fetch") {
    if (args.size() != 3) return -1;
    WriteFile(args[2], documents.FetchDocumentByDocId(args[0], args[1]));
    return 0;
  }

  if (cmd == "export") {
    if (args.size() != 2) return -1;
    std::filesystem::create_directories(args[1]);
    for (const auto& document : documents.GetDocumentsWithMetadata(args[0])) {
      const auto path = std::filesystem::path(args[1]) / docstore::core::ExportFileName(document.record);
      WriteFile(path.string(), document.content);
      PrintRecord(document.record);
    }
    return 0;
  }

  if (cmd == "delete") {
    if (args.size() != 2) return -1;
    const auto result = documents.DeleteDocument(args[0], args[1]);
    std::cout << docstore::model::ToString(result.status) << ' ' << result.message << '\n';
    return 0;
  }

  return -1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string              config_path = argv[2];
  const std::string              cmd         = argv[3];
  const std::vector<std::string> args(argv + 4, argv + argc);

  try {
    auto config = docstore::config::ConfigLoader::LoadFromYaml(config_path);
    docstore::observability::InitializeLogging(config.logging());

    auto app = docstore::factory::Build(config);

    const int rc = Run(*app.documents, cmd, args);
    docstore::observability::ShutdownLogging();
    if (rc < 0) {
      Usage();
      return 1;
    }
    return rc;
  } catch (const std::exception& e) {
    std::cerr << "docstorectl: " << e.what() << "\n";
    docstore::observability::ShutdownLogging();
    return 2;
  }
}
