#pragma once

#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/model/document.hpp"
#include "internal/util/uuid.hpp"

namespace docstore::core {

/*
  Document addressing.

  A document is addressed without any index:

      doc_id = UUIDv5(id_namespace, transaction_id + doc_cat_code)
      key    = transaction_id + "/" + doc_id

  so the same (transaction, category) always lands on the same object and
  re-uploading a category replaces it.
*/

struct DocumentOptions {
  docstore::util::UUID                     id_namespace   = docstore::util::kNamespaceOid;
  docstore::runtime::config::ListingPolicy listing_policy = docstore::runtime::config::LISTING_POLICY_FAIL_FAST;
  docstore::runtime::config::FormatRule    format_rule    = docstore::runtime::config::FORMAT_RULE_FIRST_DOT;
};

DocumentOptions FromConfig(const docstore::runtime::config::DocumentConfig& config);

std::string DeriveDocumentId(const docstore::util::UUID& id_namespace, const std::string& transaction_id, const std::string& doc_cat_code);

// Throws std::invalid_argument unless both sides are single path components.
std::string ObjectKey(const std::string& transaction_id, const std::string& doc_id);

/*
  File format (extension) of a filename, or nullopt when it has none.

    FORMAT_RULE_FIRST_DOT: second non-empty '.'-separated token
                           "scan.final.png" -> "final"
    FORMAT_RULE_LAST_DOT:  text after the last '.'
                           "scan.final.png" -> "png"
*/
std::optional<std::string> DocumentFileFormat(const std::string& filename, docstore::runtime::config::FormatRule rule);

// "<doc_id>.<format>"; throws std::invalid_argument unless it is a single path component.
std::string ExportFileName(const model::DocumentRecord& record);

model::ObjectMetadata BuildMetadata(const std::string& doc_id, const std::string& doc_name, const std::string& doc_cat_code,
                                    const std::string& doc_typ_code, const std::string& lang_code);

/*
  Project stored metadata into a record.

  Throws MetadataCorrupt when a key is missing, docid/docname/doccatcode is
  empty, docname has no file format, or docid disagrees with the object name.
*/
model::DocumentRecord RecordFromMetadata(const std::string& transaction_id, const std::string& object_name,
                                         const model::ObjectMetadata& metadata, docstore::runtime::config::FormatRule rule);

} // namespace docstore::core
