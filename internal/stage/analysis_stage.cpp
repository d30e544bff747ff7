#include "analysis_stage.hpp"

#include <stdexcept>

#include "internal/pipeline/pipeline_definition.hpp"
#include "internal/util/utf8.hpp"

namespace docflow::stage {

AnalysisStage::AnalysisStage(analysis::SentimentDetectorPtr detector, std::size_t max_text_chars, std::string language_code)
    : detector_(std::move(detector)), max_text_chars_(max_text_chars), language_code_(std::move(language_code)) {
  if (!detector_) {
    throw std::invalid_argument("AnalysisStage: null sentiment detector");
  }
  if (max_text_chars_ == 0) {
    throw std::invalid_argument("AnalysisStage: max_text_chars must be positive");
  }
}

std::string AnalysisStage::Name() const {
  return pipeline::kAnalyzeText;
}

StageResult AnalysisStage::Execute(const model::StagePayload& payload, const StageContext& /*context*/) {
  if (!model::HasKey(payload, "text")) {
    return StageResult::Fail("payload has no text to analyze");
  }

  const auto text = util::TruncateCodePoints(model::GetString(payload, "text"), max_text_chars_);

  analysis::SentimentResult sentiment;
  try {
    sentiment = detector_->DetectSentiment(text, language_code_);
  } catch (const std::exception& e) {
    return ClassifyFailure(e);
  }

  model::StagePayload update;
  auto& analysis = *(*update.mutable_fields())["analysis"].mutable_struct_value()->mutable_fields();
  analysis["sentiment"].set_string_value(sentiment.label);

  auto& scores = *analysis["scores"].mutable_struct_value()->mutable_fields();
  for (const auto& [label, score] : sentiment.scores) {
    scores[label].set_number_value(score);
  }
  return StageResult::Ok(std::move(update));
}

} // namespace docflow::stage
