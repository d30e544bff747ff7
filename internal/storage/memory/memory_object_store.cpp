#include "memory_object_store.hpp"

#include <mutex>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace docflow::storage {

std::string MemoryObjectStore::Key(const std::string& container, const std::string& key) {
  return common::ObjectPath("", container, key);
}

std::string MemoryObjectStore::Read(const std::string& container, const std::string& key) {
  std::shared_lock lock(mutex_);
  auto             it = objects_.find(Key(container, key));
  if (it == objects_.end()) {
    throw util::NotFound("object not found: " + container + "/" + key);
  }
  return it->second.body;
}

void MemoryObjectStore::Write(const std::string& container, const std::string& key, const std::string& body, const std::string& content_type,
                              const runtime::CancellationToken* fence) {
  auto path   = Key(container, key);
  auto commit = [&] {
    std::unique_lock lock(mutex_);
    objects_[path] = Object{body, content_type};
  };

  if (!fence) {
    commit();
    return;
  }
  if (!fence->PublishUnlessCancelled(commit)) {
    throw util::Cancelled("write of " + container + "/" + key + " cancelled");
  }
}

bool MemoryObjectStore::Exists(const std::string& container, const std::string& key) {
  std::shared_lock lock(mutex_);
  return objects_.contains(Key(container, key));
}

std::string MemoryObjectStore::ContentType(const std::string& container, const std::string& key) const {
  std::shared_lock lock(mutex_);
  auto             it = objects_.find(Key(container, key));
  return it == objects_.end() ? std::string() : it->second.content_type;
}

} // namespace docflow::storage
