#pragma once

#include <memory>
#include <string>

#include <arrow/filesystem/filesystem.h>

#include "internal/storage/object_store.hpp"

namespace docflow::storage {

/*
  Object store on top of an Arrow filesystem.

  Layout:

      <root>/<container>/<key>

  With a local filesystem a container is a directory under root; with S3
  (root empty) it is the bucket.

  Characteristics:
    - whole-object reads and writes
    - a write lands on <key>.staging-<uuid> first and is moved into place,
      so readers never see a partial object
    - no fsync semantics; object stores are atomic per PUT
*/
class ArrowObjectStore final : public ObjectStore {
 public:
  ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root);

  // Resolves fs and root from anything arrow::fs::FileSystemFromUri accepts.
  static std::shared_ptr<ArrowObjectStore> FromUri(const std::string& uri);

  std::string Read(const std::string& container, const std::string& key) override;

  void Write(const std::string& container, const std::string& key, const std::string& body, const std::string& content_type,
             const runtime::CancellationToken* fence = nullptr) override;

  bool Exists(const std::string& container, const std::string& key) override;

 private:
  std::string Path(const std::string& container, const std::string& key) const;

  void Discard(const std::string& path);

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_;
};

} // namespace docflow::storage
