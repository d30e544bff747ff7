#pragma once

#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/storage/object_store.hpp"

namespace docflow::storage {

/*
  In-process object store.

  Thread safety:
    - shared reads
    - exclusive writes
*/
class MemoryObjectStore final : public ObjectStore {
 public:
  std::string Read(const std::string& container, const std::string& key) override;

  void Write(const std::string& container, const std::string& key, const std::string& body, const std::string& content_type,
             const runtime::CancellationToken* fence = nullptr) override;

  bool Exists(const std::string& container, const std::string& key) override;

  // Content type recorded by the last Write, empty if unknown.
  std::string ContentType(const std::string& container, const std::string& key) const;

 private:
  struct Object {
    std::string body;
    std::string content_type;
  };

  static std::string Key(const std::string& container, const std::string& key);

  mutable std::shared_mutex               mutex_;
  std::unordered_map<std::string, Object> objects_;
};

} // namespace docflow::storage
