#include "object_text_detector.hpp"

#include <stdexcept>

#include "internal/model/document_ref.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/utf8.hpp"

namespace docflow::analysis {
namespace {

bool IsBlank(const std::string& line) {
  return line.find_first_not_of(" \t") == std::string::npos;
}

} // namespace

ObjectTextDetector::ObjectTextDetector(storage::ObjectStorePtr store) : store_(std::move(store)) {
  if (!store_) {
    throw std::invalid_argument("ObjectTextDetector: null object store");
  }
}

std::vector<std::string> ObjectTextDetector::DetectText(const docflow::v1::DocumentRef& document) {
  std::string body;
  try {
    body = store_->Read(document.container(), document.key());
  } catch (const util::NotFound&) {
    throw util::MalformedDocument("document not found: " + model::ToString(document));
  }

  if (!util::IsValidUtf8(body)) {
    throw util::MalformedDocument("document is not valid UTF-8 text: " + model::ToString(document));
  }

  std::vector<std::string> lines;
  std::size_t              start = 0;
  while (start <= body.size()) {
    auto end = body.find('\n', start);
    if (end == std::string::npos) end = body.size();

    std::string line = body.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!IsBlank(line)) lines.push_back(std::move(line));

    start = end + 1;
  }
  return lines;
}

} // namespace docflow::analysis
