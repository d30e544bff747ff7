#include "lexicon_sentiment_detector.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <utility>
#include <vector>

#include "internal/util/errors.hpp"

namespace docflow::analysis {
namespace {

constexpr const char* kPositiveWords[] = {
    "hello",     "welcome", "good",      "great",   "excellent", "happy",   "love",     "like",      "nice",   "best",
    "wonderful", "amazing", "fantastic", "pleased", "thanks",    "thank",   "success",  "succeeded", "better", "positive",
    "enjoy",     "glad",    "perfect",   "awesome", "approved",  "correct", "improved", "helpful",   "win",    "beautiful",
};

constexpr const char* kNegativeWords[] = {
    "bad",      "terrible", "awful",  "horrible", "sad",     "hate",   "poor",         "worst",   "worse",    "fail",
    "failed",   "failure",  "error",  "angry",    "problem", "broken", "disappointed", "wrong",   "negative", "rejected",
    "annoying", "ugly",     "refund", "late",     "damaged", "lost",   "complaint",    "useless", "never",    "unhappy",
};

std::vector<std::string> Tokenize(const std::string& text) {
  std::vector<std::string> tokens;
  std::string              current;
  for (unsigned char c : text) {
    // Bytes >= 0x80 belong to multi-byte code points; keep them inside words.
    if (std::isalnum(c) || c == '\'' || c >= 0x80) {
      current.push_back(static_cast<char>(std::tolower(c)));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) tokens.push_back(std::move(current));
  return tokens;
}

} // namespace

LexiconSentimentDetector::LexiconSentimentDetector()
    : positive_(std::begin(kPositiveWords), std::end(kPositiveWords)), negative_(std::begin(kNegativeWords), std::end(kNegativeWords)) {
}

SentimentDetectorPtr LexiconSentimentDetector::Create() {
  return std::make_shared<LexiconSentimentDetector>();
}

SentimentResult LexiconSentimentDetector::DetectSentiment(const std::string& text, const std::string& language_code) {
  if (language_code != "en") {
    throw util::Unsupported("sentiment language not supported: " + language_code);
  }

  double positive = 0;
  double negative = 0;
  for (const auto& token : Tokenize(text)) {
    if (positive_.contains(token)) positive += 1;
    if (negative_.contains(token)) negative += 1;
  }

  const double mixed   = std::min(positive, negative);
  const double neutral = (positive + negative) == 0 ? 1.0 : 0.5;
  const double total   = positive + negative + mixed + neutral;

  SentimentResult result;
  result.scores["Positive"] = positive / total;
  result.scores["Negative"] = negative / total;
  result.scores["Mixed"]    = mixed / total;
  result.scores["Neutral"]  = neutral / total;

  const std::array<std::pair<const char*, double>, 4> ranked = {{
      {kMixed, mixed},
      {kPositive, positive},
      {kNegative, negative},
      {kNeutral, neutral},
  }};

  auto best = ranked[0];
  for (const auto& candidate : ranked) {
    if (candidate.second > best.second) best = candidate;
  }
  result.label = best.first;
  return result;
}

} // namespace docflow::analysis
