#include "document_ref.hpp"

#include "internal/util/errors.hpp"

namespace docflow::model {

docflow::v1::DocumentRef MakeDocumentRef(const std::string& container, const std::string& key) {
  docflow::v1::DocumentRef ref;
  ref.set_container(container);
  ref.set_key(key);
  return ref;
}

void ValidateDocumentRef(const docflow::v1::DocumentRef& ref) {
  if (ref.container().empty()) {
    throw util::InvalidArgument("document container must not be empty");
  }
  if (ref.key().empty()) {
    throw util::InvalidArgument("document key must not be empty");
  }
}

std::string ToString(const docflow::v1::DocumentRef& ref) {
  return ref.container() + "/" + ref.key();
}

} // namespace docflow::model
