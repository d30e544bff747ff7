#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/pipeline/pipeline_definition.hpp"
#include "stage_executor.hpp"

namespace docflow::stage {

/*
  Stage name → executor.

  Filled once while the runtime is built and read-only afterwards.
*/
class StageRegistry {
 public:
  // Registers under executor->Name(). Throws util::AlreadyExists on duplicates.
  void Register(std::shared_ptr<StageExecutor> executor);

  // Registers under an explicit name (one executor may serve several stages).
  void Register(const std::string& name, std::shared_ptr<StageExecutor> executor);

  std::shared_ptr<StageExecutor> Find(const std::string& name) const;

  // Throws util::InvalidArgument when nothing is registered under name.
  std::shared_ptr<StageExecutor> Resolve(const std::string& name) const;

  // Throws util::InvalidArgument naming every stage of `definition` with no executor.
  void Validate(const pipeline::PipelineDefinition& definition) const;

  std::vector<std::string> Names() const;

 private:
  std::unordered_map<std::string, std::shared_ptr<StageExecutor>> executors_;
};

} // namespace docflow::stage
