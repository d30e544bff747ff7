#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>

#include "docflow/v1/types.pb.h"
#include "internal/model/stage_payload.hpp"
#include "internal/runtime/cancellation.hpp"

namespace docflow::stage {

enum class StageOutcome {
  Success,
  Retryable,
  Fatal,
};

const char* OutcomeName(StageOutcome outcome);

/*
  Result of one stage attempt.

  On Success `payload` carries the keys the stage adds (or the whole updated
  payload; the orchestrator merges additively either way). On failure
  `reason` ends up in the execution's last_error.
*/
struct StageResult {
  StageOutcome        outcome = StageOutcome::Success;
  std::string         reason;
  model::StagePayload payload;

  static StageResult Ok(model::StagePayload payload) {
    return {StageOutcome::Success, {}, std::move(payload)};
  }

  static StageResult Retry(std::string reason) {
    return {StageOutcome::Retryable, std::move(reason), {}};
  }

  static StageResult Fail(std::string reason) {
    return {StageOutcome::Fatal, std::move(reason), {}};
  }

  explicit operator bool() const {
    return outcome == StageOutcome::Success;
  }
};

struct StageContext {
  docflow::v1::DocumentRef document;
  std::string              execution_id;

  // 1-based attempt number of this call.
  uint32_t attempt = 1;

  // Collaborator calls should not outlive this.
  std::chrono::steady_clock::time_point deadline;

  // Per attempt. Cancelled when the run is cancelled or the attempt is
  // abandoned; anything the stage publishes goes through its fence.
  std::shared_ptr<const runtime::CancellationToken> cancel;
};

/*
  One named unit of work.

  Execute() must be a function of its input payload and collaborator state
  only; an executor instance is shared by all executions and may be called
  concurrently.
*/
class StageExecutor {
 public:
  virtual ~StageExecutor() = default;

  virtual std::string Name() const = 0;

  virtual StageResult Execute(const model::StagePayload& payload, const StageContext& context) = 0;
};

/*
  Maps a collaborator exception to a stage result:

    TransientError, StoreUnavailable            → Retryable
    MalformedDocument, Unsupported,
    InvalidArgument, NotFound                   → Fatal
    anything else                               → Retryable
*/
StageResult ClassifyFailure(const std::exception& e);

} // namespace docflow::stage
