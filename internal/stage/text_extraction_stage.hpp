#pragma once

#include "internal/analysis/text_detector.hpp"
#include "stage_executor.hpp"

namespace docflow::stage {

/*
  ExtractText

  Runs the OCR collaborator over the document and stores the detected lines,
  joined with '\n', under `text`.
*/
class TextExtractionStage final : public StageExecutor {
 public:
  explicit TextExtractionStage(analysis::TextDetectorPtr detector);

  std::string Name() const override;

  StageResult Execute(const model::StagePayload& payload, const StageContext& context) override;

 private:
  analysis::TextDetectorPtr detector_;
};

} // namespace docflow::stage
