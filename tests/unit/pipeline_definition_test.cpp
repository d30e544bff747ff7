#include "internal/pipeline/pipeline_definition.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using docflow::pipeline::BackoffDelay;
using docflow::pipeline::PipelineDefinition;
using docflow::pipeline::StageSpec;
using std::chrono::milliseconds;

StageSpec MakeStage(const std::string& name) {
  StageSpec spec;
  spec.name = name;
  return spec;
}

bool Rejects(std::vector<StageSpec> stages) {
  try {
    PipelineDefinition definition(std::move(stages));
    return false;
  } catch (const docflow::util::InvalidArgument&) {
    return true;
  }
}

void TestDefaultPipelineOrderAndPolicy() {
  const auto pipeline = PipelineDefinition::Default();

  assert(pipeline.Size() == 4);
  assert(pipeline.At(0).name == "ExtractMetadata");
  assert(pipeline.At(1).name == "ExtractText");
  assert(pipeline.At(2).name == "AnalyzeText");
  assert(pipeline.At(3).name == "StoreResults");

  for (const auto& stage : pipeline) {
    assert(stage.max_attempts == 3);
    assert(stage.backoff_base == milliseconds(1000));
    assert(stage.max_backoff == milliseconds(30000));
    assert(stage.timeout == milliseconds(300000));
  }
}

void TestLookupByName() {
  const auto pipeline = PipelineDefinition::Default();

  assert(pipeline.IndexOf("AnalyzeText").value() == 2);
  assert(!pipeline.IndexOf("analyzetext").has_value());

  bool threw = false;
  try {
    pipeline.At(4);
  } catch (const docflow::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestValidationRejectsBadStages() {
  assert(Rejects({MakeStage("")}));
  assert(Rejects({MakeStage("a"), MakeStage("a")}));

  auto zero_attempts         = MakeStage("a");
  zero_attempts.max_attempts = 0;
  assert(Rejects({zero_attempts}));

  auto negative_base         = MakeStage("a");
  negative_base.backoff_base = milliseconds(-1);
  assert(Rejects({negative_base}));

  auto cap_below_base        = MakeStage("a");
  cap_below_base.backoff_base = milliseconds(500);
  cap_below_base.max_backoff  = milliseconds(100);
  assert(Rejects({cap_below_base}));

  auto zero_timeout    = MakeStage("a");
  zero_timeout.timeout = milliseconds(0);
  assert(Rejects({zero_timeout}));

  // An empty pipeline is valid: every execution succeeds immediately.
  assert(!Rejects({}));
}

void TestBackoffDoublesUpToCap() {
  StageSpec spec     = MakeStage("a");
  spec.backoff_base  = milliseconds(1000);
  spec.max_backoff   = milliseconds(5000);

  assert(BackoffDelay(spec, 0) == milliseconds(0));
  assert(BackoffDelay(spec, 1) == milliseconds(1000));
  assert(BackoffDelay(spec, 2) == milliseconds(2000));
  assert(BackoffDelay(spec, 3) == milliseconds(4000));
  assert(BackoffDelay(spec, 4) == milliseconds(5000));
  assert(BackoffDelay(spec, 60) == milliseconds(5000));

  spec.backoff_base = milliseconds(0);
  spec.max_backoff  = milliseconds(0);
  assert(BackoffDelay(spec, 3) == milliseconds(0));
}

} // namespace

int main() {
  TestDefaultPipelineOrderAndPolicy();
  TestLookupByName();
  TestValidationRejectsBadStages();
  TestBackoffDoublesUpToCap();

  std::cout << "docflow_unit_pipeline_definition: pass\n";
  return 0;
}
