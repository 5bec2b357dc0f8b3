#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

#include <arrow/buffer.h>

namespace docstore::model {

/*
  Flat key/value metadata attached to a stored object.

  Ordered so that serialization and logging are deterministic.
*/
using ObjectMetadata = std::map<std::string, std::string>;

// Metadata keys written for every document.
inline constexpr std::string_view kDocCatCodeKey = "doccatcode";
inline constexpr std::string_view kDocTypCodeKey = "doctypcode";
inline constexpr std::string_view kLangCodeKey   = "langcode";
inline constexpr std::string_view kDocNameKey    = "docname";
inline constexpr std::string_view kDocIdKey      = "docid";

/*
  Caller-facing view of a stored document.

  Built from upload inputs or from stored metadata; never persisted
  on its own. Two records are equal when every field is equal.
*/
struct DocumentRecord {
  std::string transaction_id;
  std::string doc_id;
  std::string doc_name;
  std::string doc_cat_code;
  std::string doc_typ_code;
  std::string doc_file_format;
};

inline bool operator==(const DocumentRecord& a, const DocumentRecord& b) {
  return std::tie(a.transaction_id, a.doc_id, a.doc_name, a.doc_cat_code, a.doc_typ_code, a.doc_file_format) ==
         std::tie(b.transaction_id, b.doc_id, b.doc_name, b.doc_cat_code, b.doc_typ_code, b.doc_file_format);
}

inline bool operator!=(const DocumentRecord& a, const DocumentRecord& b) {
  return !(a == b);
}

// One entry per stored object, even when records compare equal.
struct DocumentWithContent {
  DocumentRecord                 record;
  std::shared_ptr<arrow::Buffer> content;
};

enum class DeletionStatus : std::uint8_t {
  kSuccess = 0,
  kFailure = 1,
};

constexpr std::string_view ToString(DeletionStatus status) {
  switch (status) {
    case DeletionStatus::kSuccess:
      return "SUCCESS";
    case DeletionStatus::kFailure:
    default:
      return "FAILURE";
  }
}

struct DeletionResult {
  DeletionStatus status = DeletionStatus::kFailure;
  std::string    message;
};

} // namespace docstore::model
