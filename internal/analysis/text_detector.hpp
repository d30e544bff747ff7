#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docflow/v1/types.pb.h"

namespace docflow::analysis {

/*
  OCR boundary.

  Returns the text lines of a document in reading order.

  Errors:
    util::TransientError       provider unavailable, throttled, timed out
    util::MalformedDocument    the document cannot be read as text
*/
class TextDetector {
 public:
  virtual ~TextDetector() = default;

  virtual std::vector<std::string> DetectText(const docflow::v1::DocumentRef& document) = 0;
};

using TextDetectorPtr = std::shared_ptr<TextDetector>;

} // namespace docflow::analysis
