#pragma once

#include "config/config.pb.h"
#include "object_store.hpp"

namespace docflow::storage {

/*
  Builds the object store collaborator from configuration.

      object_store: { memory: {} }                  → MemoryObjectStore
      object_store: { arrow: { uri: "/data" } }     → ArrowObjectStore
      (unset)                                       → MemoryObjectStore
*/

class ObjectStoreFactory {
public:
  static ObjectStorePtr Build(const docflow::runtime::config::ObjectStoreConfig& cfg);
};

} // namespace docflow::storage
