#pragma once

#include <string>

#include "internal/storage/object_store.hpp"
#include "stage_executor.hpp"

namespace docflow::stage {

inline constexpr const char* kDefaultResultsPrefix = "results/";

/*
  StoreResults

  Writes the accumulated payload, plus result_path, as indented JSON to
  <results_prefix><key>.json in the document's container, then adds

    result_path = "<container>/<results_prefix><key>.json"

  to the payload. Storage errors are classified like any collaborator error.

  The write is fenced by the attempt's cancellation token: once the
  orchestrator abandons the attempt (timeout or cancel) the artifact can no
  longer appear.
*/
class PersistenceStage final : public StageExecutor {
 public:
  explicit PersistenceStage(storage::ObjectStorePtr store, std::string results_prefix = kDefaultResultsPrefix);

  std::string Name() const override;

  StageResult Execute(const model::StagePayload& payload, const StageContext& context) override;

  // Object key the results of `document_key` are written to.
  std::string ResultKey(const std::string& document_key) const;

 private:
  storage::ObjectStorePtr store_;
  std::string             results_prefix_;
};

} // namespace docflow::stage
