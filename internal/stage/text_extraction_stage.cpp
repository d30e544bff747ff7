#include "text_extraction_stage.hpp"

#include <stdexcept>

#include "internal/pipeline/pipeline_definition.hpp"

namespace docflow::stage {

TextExtractionStage::TextExtractionStage(analysis::TextDetectorPtr detector) : detector_(std::move(detector)) {
  if (!detector_) {
    throw std::invalid_argument("TextExtractionStage: null text detector");
  }
}

std::string TextExtractionStage::Name() const {
  return pipeline::kExtractText;
}

StageResult TextExtractionStage::Execute(const model::StagePayload& /*payload*/, const StageContext& context) {
  std::vector<std::string> lines;
  try {
    lines = detector_->DetectText(context.document);
  } catch (const std::exception& e) {
    return ClassifyFailure(e);
  }

  std::string text;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) text += '\n';
    text += lines[i];
  }

  model::StagePayload update;
  (*update.mutable_fields())["text"].set_string_value(text);
  return StageResult::Ok(std::move(update));
}

} // namespace docflow::stage
