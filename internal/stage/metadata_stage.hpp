#pragma once

#include "stage_executor.hpp"

namespace docflow::stage {

/*
  ExtractMetadata

  Adds metadata = {title: last path segment of the key, source: container}.
  Pure; fails fatally only for a key without a file name ("a/b/").
*/
class MetadataStage final : public StageExecutor {
 public:
  std::string Name() const override;

  StageResult Execute(const model::StagePayload& payload, const StageContext& context) override;
};

} // namespace docflow::stage
