#include "arrow_object_store.hpp"

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/util/key_value_metadata.h>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace docflow::storage {

namespace {

/*
  Arrow Status → util errors. I/O failures are transient from the
  pipeline's point of view; everything else is a bug or misconfiguration.
*/
void ThrowIfError(const arrow::Status& status, const std::string& context) {
  if (status.ok()) return;
  if (status.IsIOError()) {
    throw util::TransientError(context + ": " + status.ToString());
  }
  throw std::runtime_error(context + ": " + status.ToString());
}

template <typename T>
T Unwrap(arrow::Result<T> result, const std::string& context) {
  ThrowIfError(result.status(), context);
  return std::move(result).ValueUnsafe();
}

} // namespace

ArrowObjectStore::ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root) : fs_(std::move(fs)), root_(std::move(root)) {
  if (!fs_) {
    throw std::invalid_argument("arrow object store requires a filesystem");
  }
}

std::shared_ptr<ArrowObjectStore> ArrowObjectStore::FromUri(const std::string& uri) {
  std::string root;
  auto        fs = Unwrap(arrow::fs::FileSystemFromUriOrPath(uri, &root), "resolve object store uri " + uri);
  return std::make_shared<ArrowObjectStore>(std::move(fs), std::move(root));
}

std::string ArrowObjectStore::Path(const std::string& container, const std::string& key) const {
  return common::ObjectPath(root_, container, key);
}

std::string ArrowObjectStore::Read(const std::string& container, const std::string& key) {
  const auto path = Path(container, key);

  auto info = Unwrap(fs_->GetFileInfo(path), "stat " + path);
  if (info.type() != arrow::fs::FileType::File) {
    throw util::NotFound("object not found: " + container + "/" + key);
  }

  auto input  = Unwrap(fs_->OpenInputFile(path), "open " + path);
  auto size   = Unwrap(input->GetSize(), "size " + path);
  auto buffer = Unwrap(input->Read(size), "read " + path);
  ThrowIfError(input->Close(), "close " + path);
  return buffer->ToString();
}

void ArrowObjectStore::Discard(const std::string& path) {
  ThrowIfError(fs_->DeleteFile(path), "delete " + path);
}

void ArrowObjectStore::Write(const std::string& container, const std::string& key, const std::string& body, const std::string& content_type,
                             const runtime::CancellationToken* fence) {
  const auto path    = Path(container, key);
  const auto staging = path + ".staging-" + util::ToString(util::GenerateUUID());

  const auto parent = path.substr(0, path.find_last_of('/'));
  ThrowIfError(fs_->CreateDir(parent, /*recursive=*/true), "create " + parent);

  std::shared_ptr<const arrow::KeyValueMetadata> metadata;
  if (!content_type.empty()) {
    metadata = arrow::key_value_metadata({"Content-Type"}, {content_type});
  }

  auto out = Unwrap(fs_->OpenOutputStream(staging, metadata), "open " + staging);
  ThrowIfError(out->Write(body.data(), static_cast<int64_t>(body.size())), "write " + staging);
  ThrowIfError(out->Close(), "close " + staging);

  auto commit = [&] { ThrowIfError(fs_->Move(staging, path), "move " + staging + " to " + path); };

  if (!fence) {
    commit();
    return;
  }
  if (!fence->PublishUnlessCancelled(commit)) {
    Discard(staging);
    throw util::Cancelled("write of " + container + "/" + key + " cancelled");
  }
}

bool ArrowObjectStore::Exists(const std::string& container, const std::string& key) {
  const auto path = Path(container, key);
  auto       info = Unwrap(fs_->GetFileInfo(path), "stat " + path);
  return info.type() == arrow::fs::FileType::File;
}

} // namespace docflow::storage
