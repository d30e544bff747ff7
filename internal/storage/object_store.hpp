#pragma once

#include <memory>
#include <string>

#include "internal/runtime/cancellation.hpp"

namespace docflow::storage {

/*
  Object storage collaborator.

  Objects are addressed by (container, key), the same pair a DocumentRef
  carries. Implementations:
    MEMORY   → in-process map (tests, embedded use)
    ARROW    → arrow::fs::FileSystem (local directory tree or S3)

  Errors:
    Read of a missing object      → util::NotFound
    transient backend failures    → util::TransientError
    Write behind a cancelled fence → util::Cancelled
*/

class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  // ------------------------------------------------------------------
  // Read
  // ------------------------------------------------------------------
  virtual std::string Read(const std::string& container, const std::string& key) = 0;

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------
  /*
    Replaces the object atomically from the reader's point of view.

    With a `fence` the object becomes visible only through
    fence->PublishUnlessCancelled(); a cancelled fence leaves no object
    behind.
  */
  virtual void Write(const std::string& container, const std::string& key, const std::string& body, const std::string& content_type,
                     const runtime::CancellationToken* fence = nullptr) = 0;

  // ------------------------------------------------------------------
  // Exists
  // ------------------------------------------------------------------
  virtual bool Exists(const std::string& container, const std::string& key) = 0;
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

} // namespace docflow::storage
