#include "object_store_factory.hpp"

#include <stdexcept>

#include "memory/memory_object_store.hpp"
#if DOCFLOW_OBJECT_STORE_ARROW
#include "arrow/arrow_object_store.hpp"
#endif

namespace docflow::storage {

ObjectStorePtr ObjectStoreFactory::Build(const docflow::runtime::config::ObjectStoreConfig& cfg) {
  if (cfg.has_arrow()) {
#if DOCFLOW_OBJECT_STORE_ARROW
    if (cfg.arrow().uri().empty()) {
      throw std::runtime_error("object_store.arrow.uri is required");
    }
    return ArrowObjectStore::FromUri(cfg.arrow().uri());
#else
    throw std::runtime_error("arrow object store requested but not enabled at build time");
#endif
  }

  return std::make_shared<MemoryObjectStore>();
}

} // namespace docflow::storage
