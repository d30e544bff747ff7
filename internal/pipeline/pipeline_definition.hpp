#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace docflow::pipeline {

// Stage names of the document pipeline, in execution order.
inline constexpr const char* kExtractMetadata = "ExtractMetadata";
inline constexpr const char* kExtractText     = "ExtractText";
inline constexpr const char* kAnalyzeText     = "AnalyzeText";
inline constexpr const char* kStoreResults    = "StoreResults";

struct StageSpec {
  std::string name;

  // Total attempts including the first one.
  uint32_t max_attempts = 3;

  std::chrono::milliseconds backoff_base{1000};
  std::chrono::milliseconds max_backoff{30000};

  // Budget of a single attempt.
  std::chrono::milliseconds timeout{300000};
};

/*
  PipelineDefinition

  Immutable ordered list of stages, shared by every execution. The
  constructor validates the list and throws util::InvalidArgument on:
    - empty or duplicate stage names
    - max_attempts < 1
    - backoff_base < 0, max_backoff < backoff_base
    - timeout <= 0
*/
class PipelineDefinition {
 public:
  explicit PipelineDefinition(std::vector<StageSpec> stages);

  // ExtractMetadata -> ExtractText -> AnalyzeText -> StoreResults with StageSpec defaults.
  static PipelineDefinition Default();

  std::size_t Size() const {
    return stages_.size();
  }

  const StageSpec& At(std::size_t index) const;

  std::optional<std::size_t> IndexOf(const std::string& name) const;

  const std::vector<StageSpec>& Stages() const {
    return stages_;
  }

  std::vector<StageSpec>::const_iterator begin() const {
    return stages_.begin();
  }
  std::vector<StageSpec>::const_iterator end() const {
    return stages_.end();
  }

 private:
  std::vector<StageSpec> stages_;
};

/*
  Delay before retry number `attempt` (1-based count of failed attempts):

      min(backoff_base * 2^(attempt-1), max_backoff)
*/
std::chrono::milliseconds BackoffDelay(const StageSpec& spec, uint32_t attempt);

} // namespace docflow::pipeline
