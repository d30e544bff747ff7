#include "metadata_stage.hpp"

#include "internal/pipeline/pipeline_definition.hpp"

namespace docflow::stage {

std::string MetadataStage::Name() const {
  return pipeline::kExtractMetadata;
}

StageResult MetadataStage::Execute(const model::StagePayload& /*payload*/, const StageContext& context) {
  const auto& key   = context.document.key();
  const auto  slash = key.find_last_of('/');
  const auto  title = slash == std::string::npos ? key : key.substr(slash + 1);

  if (title.empty()) {
    return StageResult::Fail("document key has no file name: " + key);
  }

  model::StagePayload update;
  auto&               metadata = *(*update.mutable_fields())["metadata"].mutable_struct_value()->mutable_fields();
  metadata["title"].set_string_value(title);
  metadata["source"].set_string_value(context.document.container());
  return StageResult::Ok(std::move(update));
}

} // namespace docflow::stage
