#include "document_addressing.hpp"

#include <stdexcept>
#include <vector>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace docstore::core {

using namespace docstore::runtime::config;
using docstore::util::MetadataCorrupt;

namespace {

std::vector<std::string> SplitNonEmpty(const std::string& text, char delimiter) {
  std::vector<std::string> tokens;
  std::string              current;
  for (char c : text) {
    if (c == delimiter) {
      if (!current.empty()) tokens.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  if (!current.empty()) tokens.push_back(std::move(current));
  return tokens;
}

const std::string& RequireEntry(const model::ObjectMetadata& metadata, std::string_view name, const std::string& object_name,
                                bool allow_empty) {
  auto it = metadata.find(std::string(name));
  if (it == metadata.end()) {
    throw MetadataCorrupt("metadata of " + object_name + " is missing " + std::string(name));
  }
  if (!allow_empty && it->second.empty()) {
    throw MetadataCorrupt("metadata of " + object_name + " has empty " + std::string(name));
  }
  return it->second;
}

} // namespace

DocumentOptions FromConfig(const DocumentConfig& config) {
  DocumentOptions options;
  if (!config.id_namespace().empty()) {
    options.id_namespace = docstore::util::FromString(config.id_namespace());
  }
  options.listing_policy = config.listing_policy();
  options.format_rule    = config.format_rule();
  return options;
}

std::string DeriveDocumentId(const docstore::util::UUID& id_namespace, const std::string& transaction_id, const std::string& doc_cat_code) {
  return docstore::util::ToString(docstore::util::NameBasedUUID(id_namespace, transaction_id + doc_cat_code));
}

std::string ObjectKey(const std::string& transaction_id, const std::string& doc_id) {
  docstore::storage::common::ValidatePathComponent("transaction id", transaction_id);
  docstore::storage::common::ValidatePathComponent("document id", doc_id);
  return transaction_id + "/" + doc_id;
}

std::optional<std::string> DocumentFileFormat(const std::string& filename, FormatRule rule) {
  switch (rule) {
    case FORMAT_RULE_LAST_DOT: {
      const auto dot = filename.find_last_of('.');
      if (dot == std::string::npos || dot == 0 || dot + 1 == filename.size()) {
        return std::nullopt;
      }
      return filename.substr(dot + 1);
    }

    case FORMAT_RULE_FIRST_DOT:
    default: {
      const auto tokens = SplitNonEmpty(filename, '.');
      if (tokens.size() < 2) {
        return std::nullopt;
      }
      return tokens[1];
    }
  }
}

std::string ExportFileName(const model::DocumentRecord& record) {
  auto name = record.doc_id + "." + record.doc_file_format;
  docstore::storage::common::ValidatePathComponent("export file name", name);
  return name;
}

model::ObjectMetadata BuildMetadata(const std::string& doc_id, const std::string& doc_name, const std::string& doc_cat_code,
                                    const std::string& doc_typ_code, const std::string& lang_code) {
  return model::ObjectMetadata{
      {std::string(model::kDocCatCodeKey), doc_cat_code}, {std::string(model::kDocTypCodeKey), doc_typ_code},
      {std::string(model::kLangCodeKey), lang_code},      {std::string(model::kDocNameKey), doc_name},
      {std::string(model::kDocIdKey), doc_id},
  };
}

model::DocumentRecord RecordFromMetadata(const std::string& transaction_id, const std::string& object_name,
                                         const model::ObjectMetadata& metadata, FormatRule rule) {
  model::DocumentRecord record;
  record.transaction_id = transaction_id;
  record.doc_id         = RequireEntry(metadata, model::kDocIdKey, object_name, false);
  record.doc_name       = RequireEntry(metadata, model::kDocNameKey, object_name, false);
  record.doc_cat_code   = RequireEntry(metadata, model::kDocCatCodeKey, object_name, false);
  record.doc_typ_code   = RequireEntry(metadata, model::kDocTypCodeKey, object_name, true);
  RequireEntry(metadata, model::kLangCodeKey, object_name, true);

  if (record.doc_id != object_name) {
    throw MetadataCorrupt("metadata docid " + record.doc_id + " does not match object " + object_name);
  }

  auto format = DocumentFileFormat(record.doc_name, rule);
  if (!format) {
    throw MetadataCorrupt("metadata docname of " + object_name + " has no file format: " + record.doc_name);
  }
  record.doc_file_format = std::move(*format);
  return record;
}

} // namespace docstore::core
