#include "pipeline_definition.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace docflow::pipeline {

PipelineDefinition::PipelineDefinition(std::vector<StageSpec> stages) : stages_(std::move(stages)) {
  std::unordered_set<std::string> seen;
  for (std::size_t i = 0; i < stages_.size(); ++i) {
    const auto& stage  = stages_[i];
    const auto  prefix = "stage " + std::to_string(i) + " (" + stage.name + "): ";

    if (stage.name.empty()) {
      throw util::InvalidArgument("stage " + std::to_string(i) + ": name must not be empty");
    }
    if (!seen.insert(stage.name).second) {
      throw util::InvalidArgument(prefix + "duplicate stage name");
    }
    if (stage.max_attempts < 1) {
      throw util::InvalidArgument(prefix + "max_attempts must be >= 1");
    }
    if (stage.backoff_base.count() < 0) {
      throw util::InvalidArgument(prefix + "backoff_base must be >= 0");
    }
    if (stage.max_backoff < stage.backoff_base) {
      throw util::InvalidArgument(prefix + "max_backoff must be >= backoff_base");
    }
    if (stage.timeout.count() <= 0) {
      throw util::InvalidArgument(prefix + "timeout must be > 0");
    }
  }
}

PipelineDefinition PipelineDefinition::Default() {
  std::vector<StageSpec> stages;
  for (const char* name : {kExtractMetadata, kExtractText, kAnalyzeText, kStoreResults}) {
    StageSpec spec;
    spec.name = name;
    stages.push_back(std::move(spec));
  }
  return PipelineDefinition(std::move(stages));
}

const StageSpec& PipelineDefinition::At(std::size_t index) const {
  if (index >= stages_.size()) {
    throw util::InvalidArgument("stage index " + std::to_string(index) + " out of range (" + std::to_string(stages_.size()) + " stages)");
  }
  return stages_[index];
}

std::optional<std::size_t> PipelineDefinition::IndexOf(const std::string& name) const {
  for (std::size_t i = 0; i < stages_.size(); ++i) {
    if (stages_[i].name == name) return i;
  }
  return std::nullopt;
}

std::chrono::milliseconds BackoffDelay(const StageSpec& spec, uint32_t attempt) {
  if (attempt == 0 || spec.backoff_base.count() == 0) {
    return std::chrono::milliseconds(0);
  }

  auto delay = spec.backoff_base;
  for (uint32_t i = 1; i < attempt && delay < spec.max_backoff; ++i) {
    delay *= 2;
  }
  return std::min(delay, spec.max_backoff);
}

} // namespace docflow::pipeline
