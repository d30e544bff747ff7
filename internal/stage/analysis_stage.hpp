#pragma once

#include <cstddef>
#include <string>

#include "internal/analysis/sentiment_detector.hpp"
#include "stage_executor.hpp"

namespace docflow::stage {

inline constexpr std::size_t kDefaultMaxTextChars = 5000;
inline constexpr const char* kDefaultLanguageCode = "en";

/*
  AnalyzeText

  Sends `text` (cut to max_text_chars code points) to the sentiment
  collaborator and adds:

    analysis = {sentiment: LABEL, scores: {Positive, Negative, Neutral, Mixed}}

  A payload without `text` is a fatal failure.
*/
class AnalysisStage final : public StageExecutor {
 public:
  AnalysisStage(analysis::SentimentDetectorPtr detector, std::size_t max_text_chars = kDefaultMaxTextChars,
                std::string language_code = kDefaultLanguageCode);

  std::string Name() const override;

  StageResult Execute(const model::StagePayload& payload, const StageContext& context) override;

 private:
  analysis::SentimentDetectorPtr detector_;
  std::size_t                    max_text_chars_;
  std::string                    language_code_;
};

} // namespace docflow::stage
