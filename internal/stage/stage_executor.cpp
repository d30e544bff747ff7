#include "stage_executor.hpp"

#include "internal/util/errors.hpp"

namespace docflow::stage {

const char* OutcomeName(StageOutcome outcome) {
  switch (outcome) {
    case StageOutcome::Success:
      return "success";
    case StageOutcome::Retryable:
      return "retryable";
    case StageOutcome::Fatal:
      return "fatal";
  }
  return "unknown";
}

StageResult ClassifyFailure(const std::exception& e) {
  using namespace docflow::util;

  if (dynamic_cast<const MalformedDocument*>(&e) || dynamic_cast<const Unsupported*>(&e) || dynamic_cast<const InvalidArgument*>(&e) ||
      dynamic_cast<const NotFound*>(&e)) {
    return StageResult::Fail(e.what());
  }
  return StageResult::Retry(e.what());
}

} // namespace docflow::stage
