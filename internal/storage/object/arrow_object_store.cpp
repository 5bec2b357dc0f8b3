#include "arrow_object_store.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <exception>
#include <limits>

#include "docstore/storage/v1/object_metadata.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace docstore::storage {

using namespace docstore::storage::common;
using docstore::observability::StringField;
using docstore::util::MetadataCorrupt;
using docstore::util::NotFound;
using docstore::util::StoreReadError;
using docstore::util::StoreUnavailable;
using docstore::util::StoreWriteError;

namespace {

constexpr char kContentDir[]     = "content";
constexpr char kMetadataDir[]    = "metadata";
constexpr char kStagingDir[]     = "staging";
constexpr char kMetadataSuffix[] = ".pb";

/*
  A file under staging/ that is removed unless committed.
*/
class StagedFile {
 public:
  StagedFile(arrow::fs::FileSystem* fs, std::string path) : fs_(fs), path_(std::move(path)) {
  }

  ~StagedFile() {
    if (committed_) return;
    try {
      Discard();
    } catch (const std::exception&) {
      // cleanup is best effort; nothing left to report to
    }
  }

  StagedFile(const StagedFile&)            = delete;
  StagedFile& operator=(const StagedFile&) = delete;

  const std::string& path() const {
    return path_;
  }

  void MarkCommitted() {
    committed_ = true;
  }

 private:
  void Discard() {
    auto info = fs_->GetFileInfo(path_);
    if (info.ok() && info->type() == arrow::fs::FileType::NotFound) {
      return;
    }

    auto status = info.ok() ? fs_->DeleteFile(path_) : info.status();
    if (!status.ok()) {
      DOCSTORE_LOG_WARN("failed to discard staged object", {StringField("path", path_), StringField("error", status.ToString())});
    }
  }

  arrow::fs::FileSystem* fs_;
  std::string            path_;
  bool                   committed_{false};
};

/*
  Put the sidecar back the way it was before a failed commit: restore the
  backup, or remove the new sidecar when the object had none.
*/
void RollbackMetadata(arrow::fs::FileSystem* fs, const std::string& key, const std::string& metadata_path, StagedFile* previous) {
  arrow::Status status;
  if (previous) {
    status = fs->Move(previous->path(), metadata_path);
    if (status.ok()) previous->MarkCommitted();
  } else {
    status = fs->DeleteFile(metadata_path);
  }

  if (!status.ok()) {
    DOCSTORE_LOG_ERROR("metadata rollback failed after content commit failure",
                       {StringField("key", key), StringField("error", status.ToString())});
  }
}

std::string ParentOf(const std::string& path) {
  const auto slash = path.find_last_of('/');
  return slash == std::string::npos ? std::string{} : path.substr(0, slash);
}

} // namespace

ArrowObjectStore::ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)) {
  if (!fs_) {
    throw std::invalid_argument("arrow object store requires a filesystem");
  }

  Unwrap<StoreUnavailable>(fs_->CreateDir(JoinPath(root_path_, kStagingDir), /*recursive=*/true), "create staging directory");
}

std::string ArrowObjectStore::ContentPath(const std::string& key) const {
  ValidateObjectKey(key);
  return JoinPath(JoinPath(root_path_, kContentDir), key);
}

std::string ArrowObjectStore::MetadataPath(const std::string& key) const {
  ValidateObjectKey(key);
  return JoinPath(JoinPath(root_path_, kMetadataDir), key + kMetadataSuffix);
}

std::string ArrowObjectStore::StagingPath() const {
  return JoinPath(JoinPath(root_path_, kStagingDir), docstore::util::ToString(docstore::util::GenerateUUID()));
}

arrow::fs::FileInfo ArrowObjectStore::RequireFile(const std::string& path, const std::string& key) {
  auto info = Unwrap<StoreReadError>(fs_->GetFileInfo(path), "stat " + key);
  if (info.type() == arrow::fs::FileType::NotFound) {
    throw NotFound("object not found: " + key);
  }
  if (!info.IsFile()) {
    throw StoreReadError("not a file: " + path);
  }
  return info;
}

void ArrowObjectStore::EnsureParentDir(const std::string& path) {
  const auto parent = ParentOf(path);
  if (!parent.empty()) {
    Unwrap<StoreWriteError>(fs_->CreateDir(parent, /*recursive=*/true), "create directory " + parent);
  }
}

/*
  Stage content, stage sidecar, back up the old sidecar, commit sidecar,
  commit content. A failed content commit restores the old sidecar.
*/
void ArrowObjectStore::Put(const std::string& key, const std::shared_ptr<arrow::io::InputStream>& content, int64_t content_length,
                           const model::ObjectMetadata& metadata) {
  const auto content_path  = ContentPath(key);
  const auto metadata_path = MetadataPath(key);
  if (content_length < 0) {
    throw std::invalid_argument("content length must not be negative");
  }

  StagedFile staged_content(fs_.get(), StagingPath());
  {
    auto out = Unwrap<StoreWriteError>(fs_->OpenOutputStream(staged_content.path()), "put " + key);
    Unwrap<StoreWriteError>(CopyStream(content, out, content_length), "put " + key);
    Unwrap<StoreWriteError>(out->Close(), "put " + key);
  }

  docstore::storage::v1::ObjectMetadata sidecar;
  sidecar.set_key(key);
  for (const auto& [name, value] : metadata) {
    (*sidecar.mutable_entries())[name] = value;
  }
  std::string serialized;
  if (!sidecar.SerializeToString(&serialized)) {
    throw StoreWriteError("serialize metadata for " + key);
  }

  StagedFile staged_metadata(fs_.get(), StagingPath());
  {
    auto out = Unwrap<StoreWriteError>(fs_->OpenOutputStream(staged_metadata.path()), "put metadata " + key);
    Unwrap<StoreWriteError>(out->Write(serialized.data(), static_cast<int64_t>(serialized.size())), "put metadata " + key);
    Unwrap<StoreWriteError>(out->Close(), "put metadata " + key);
  }

  // the sidecar being replaced, kept until the content is committed
  StagedFile previous_metadata(fs_.get(), StagingPath());
  const auto existing     = Unwrap<StoreWriteError>(fs_->GetFileInfo(metadata_path), "stat metadata " + key);
  const bool had_metadata = existing.IsFile();
  if (had_metadata) {
    Unwrap<StoreWriteError>(fs_->CopyFile(metadata_path, previous_metadata.path()), "back up metadata " + key);
  }

  EnsureParentDir(metadata_path);
  Unwrap<StoreWriteError>(fs_->Move(staged_metadata.path(), metadata_path), "commit metadata " + key);
  staged_metadata.MarkCommitted();

  EnsureParentDir(content_path);
  auto status = fs_->Move(staged_content.path(), content_path);
  if (!status.ok()) {
    RollbackMetadata(fs_.get(), key, metadata_path, had_metadata ? &previous_metadata : nullptr);
    Unwrap<StoreWriteError>(status, "commit " + key);
  }
  staged_content.MarkCommitted();
}

std::shared_ptr<arrow::Buffer> ArrowObjectStore::Get(const std::string& key) {
  const auto info  = RequireFile(ContentPath(key), key);
  auto       input = Unwrap<StoreReadError>(fs_->OpenInputFile(info), "open " + key);
  auto       size  = Unwrap<StoreReadError>(input->GetSize(), "size " + key);
  return Unwrap<StoreReadError>(input->ReadAt(0, size), "read " + key);
}

model::ObjectMetadata ArrowObjectStore::GetMetadata(const std::string& key) {
  RequireFile(ContentPath(key), key);

  const auto metadata_path = MetadataPath(key);
  const auto info          = Unwrap<StoreReadError>(fs_->GetFileInfo(metadata_path), "stat metadata " + key);
  if (info.type() == arrow::fs::FileType::NotFound) {
    throw NotFound("metadata not found: " + key);
  }

  auto input = Unwrap<StoreReadError>(fs_->OpenInputFile(info), "open metadata " + key);
  auto size  = Unwrap<StoreReadError>(input->GetSize(), "size metadata " + key);
  if (size > std::numeric_limits<int>::max()) {
    throw MetadataCorrupt("metadata sidecar too large: " + key);
  }
  auto bytes = Unwrap<StoreReadError>(input->ReadAt(0, size), "read metadata " + key);

  docstore::storage::v1::ObjectMetadata sidecar;
  if (!sidecar.ParseFromArray(bytes->data(), static_cast<int>(bytes->size()))) {
    throw MetadataCorrupt("unparsable metadata sidecar: " + key);
  }
  if (sidecar.key() != key) {
    throw MetadataCorrupt("metadata sidecar belongs to " + sidecar.key() + ", expected " + key);
  }

  model::ObjectMetadata metadata;
  for (const auto& [name, value] : sidecar.entries()) {
    metadata.emplace(name, value);
  }
  return metadata;
}

std::vector<std::string> ArrowObjectStore::List(const std::string& prefix) {
  ValidatePathComponent("list prefix", prefix);

  arrow::fs::FileSelector selector;
  selector.base_dir        = JoinPath(JoinPath(root_path_, kContentDir), prefix);
  selector.allow_not_found = true;
  selector.recursive       = false;

  const auto infos = Unwrap<StoreReadError>(fs_->GetFileInfo(selector), "list " + prefix);

  std::vector<std::string> names;
  names.reserve(infos.size());
  for (const auto& info : infos) {
    if (info.IsFile()) names.push_back(info.base_name());
  }
  return names;
}

/*
  Content removal decides the outcome; a leftover sidecar is only logged
  since it is unreachable without its content.
*/
bool ArrowObjectStore::Delete(const std::string& key) {
  const auto content_path = ContentPath(key);

  auto info = fs_->GetFileInfo(content_path);
  if (!info.ok()) {
    DOCSTORE_LOG_WARN("delete: stat failed", {StringField("key", key), StringField("error", info.status().ToString())});
    return false;
  }
  if (!info->IsFile()) {
    return false;
  }

  auto status = fs_->DeleteFile(content_path);
  if (!status.ok()) {
    DOCSTORE_LOG_WARN("delete: content removal failed", {StringField("key", key), StringField("error", status.ToString())});
    return false;
  }

  status = fs_->DeleteFile(MetadataPath(key));
  if (!status.ok()) {
    DOCSTORE_LOG_WARN("delete: metadata sidecar removal failed", {StringField("key", key), StringField("error", status.ToString())});
  }
  return true;
}

} // namespace docstore::storage
