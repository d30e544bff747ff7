#include "persistence_stage.hpp"

#include <stdexcept>

#include "internal/pipeline/pipeline_definition.hpp"

namespace docflow::stage {

PersistenceStage::PersistenceStage(storage::ObjectStorePtr store, std::string results_prefix)
    : store_(std::move(store)), results_prefix_(std::move(results_prefix)) {
  if (!store_) {
    throw std::invalid_argument("PersistenceStage: null object store");
  }
}

std::string PersistenceStage::Name() const {
  return pipeline::kStoreResults;
}

std::string PersistenceStage::ResultKey(const std::string& document_key) const {
  return results_prefix_ + document_key + ".json";
}

StageResult PersistenceStage::Execute(const model::StagePayload& payload, const StageContext& context) {
  const auto& container   = context.document.container();
  const auto  result_key  = ResultKey(context.document.key());
  const auto  result_path = container + "/" + result_key;

  model::StagePayload document = payload;
  (*document.mutable_fields())["result_path"].set_string_value(result_path);

  try {
    store_->Write(container, result_key, model::ToJson(document, /*pretty=*/true), "application/json", context.cancel.get());
  } catch (const std::exception& e) {
    return ClassifyFailure(e);
  }

  model::StagePayload update;
  (*update.mutable_fields())["result_path"].set_string_value(result_path);
  return StageResult::Ok(std::move(update));
}

} // namespace docflow::stage
