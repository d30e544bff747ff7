#include "stage_registry.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace docflow::stage {

void StageRegistry::Register(std::shared_ptr<StageExecutor> executor) {
  if (!executor) {
    throw util::InvalidArgument("cannot register a null stage executor");
  }
  const auto name = executor->Name();
  Register(name, std::move(executor));
}

void StageRegistry::Register(const std::string& name, std::shared_ptr<StageExecutor> executor) {
  if (!executor) {
    throw util::InvalidArgument("cannot register a null stage executor for " + name);
  }
  if (!executors_.emplace(name, std::move(executor)).second) {
    throw util::AlreadyExists("stage executor already registered: " + name);
  }
}

std::shared_ptr<StageExecutor> StageRegistry::Find(const std::string& name) const {
  auto it = executors_.find(name);
  return it == executors_.end() ? nullptr : it->second;
}

std::shared_ptr<StageExecutor> StageRegistry::Resolve(const std::string& name) const {
  auto executor = Find(name);
  if (!executor) {
    throw util::InvalidArgument("no stage executor registered for " + name);
  }
  return executor;
}

void StageRegistry::Validate(const pipeline::PipelineDefinition& definition) const {
  std::string missing;
  for (const auto& stage : definition) {
    if (executors_.contains(stage.name)) continue;
    if (!missing.empty()) missing += ", ";
    missing += stage.name;
  }
  if (!missing.empty()) {
    throw util::InvalidArgument("pipeline references unregistered stages: " + missing);
  }
}

std::vector<std::string> StageRegistry::Names() const {
  std::vector<std::string> names;
  names.reserve(executors_.size());
  for (const auto& [name, _] : executors_) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace docflow::stage
