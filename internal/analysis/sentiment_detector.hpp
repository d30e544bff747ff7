#pragma once

#include <map>
#include <memory>
#include <string>

namespace docflow::analysis {

inline constexpr const char* kPositive = "POSITIVE";
inline constexpr const char* kNegative = "NEGATIVE";
inline constexpr const char* kNeutral  = "NEUTRAL";
inline constexpr const char* kMixed    = "MIXED";

struct SentimentResult {
  // One of kPositive, kNegative, kNeutral, kMixed.
  std::string label;

  // Keyed "Positive", "Negative", "Neutral", "Mixed"; values in [0, 1].
  std::map<std::string, double> scores;
};

/*
  Sentiment boundary.

  Errors:
    util::TransientError    provider unavailable
    util::Unsupported       language not supported
*/
class SentimentDetector {
 public:
  virtual ~SentimentDetector() = default;

  virtual SentimentResult DetectSentiment(const std::string& text, const std::string& language_code) = 0;
};

using SentimentDetectorPtr = std::shared_ptr<SentimentDetector>;

} // namespace docflow::analysis
