#pragma once

#include "internal/storage/object_store.hpp"
#include "text_detector.hpp"

namespace docflow::analysis {

/*
  TextDetector over plain-text objects.

  Reads the document through the ObjectStore and returns its non-blank lines
  (CR/LF tolerant). Content that is not valid UTF-8, or a missing object, is
  a malformed document.
*/
class ObjectTextDetector final : public TextDetector {
 public:
  explicit ObjectTextDetector(storage::ObjectStorePtr store);

  std::vector<std::string> DetectText(const docflow::v1::DocumentRef& document) override;

 private:
  storage::ObjectStorePtr store_;
};

} // namespace docflow::analysis
