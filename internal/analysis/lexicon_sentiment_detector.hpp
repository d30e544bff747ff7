#pragma once

#include <string>
#include <unordered_set>

#include "sentiment_detector.hpp"

namespace docflow::analysis {

/*
  Word-list sentiment scoring for English text.

  Each token found in the positive or negative list counts once. Scores are
  normalised to sum to 1:

    Positive ∝ positive hits
    Negative ∝ negative hits
    Mixed    ∝ min(positive, negative)
    Neutral  ∝ 1 with no hits, 0.5 otherwise

  The label is the highest score; ties go to MIXED, then POSITIVE, NEGATIVE,
  NEUTRAL. Any language other than "en" throws util::Unsupported.
*/
class LexiconSentimentDetector final : public SentimentDetector {
 public:
  LexiconSentimentDetector();

  static SentimentDetectorPtr Create();

  SentimentResult DetectSentiment(const std::string& text, const std::string& language_code) override;

 private:
  std::unordered_set<std::string> positive_;
  std::unordered_set<std::string> negative_;
};

} // namespace docflow::analysis
