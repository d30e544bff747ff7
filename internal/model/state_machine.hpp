#pragma once

#include "docflow/v1/types.pb.h"

namespace docflow::model {

using docflow::v1::ExecutionStatus;

constexpr bool IsTerminal(ExecutionStatus status) {
  return status == docflow::v1::EXECUTION_STATUS_SUCCEEDED || status == docflow::v1::EXECUTION_STATUS_FAILED;
}

/*
  Allowed execution transitions:

      PENDING  -> RUNNING
      RUNNING  -> RUNNING | PENDING (cancel) | SUCCEEDED | FAILED
      terminal -> (nothing; reopening is a replay, not a transition)
*/
constexpr bool CanTransition(ExecutionStatus from, ExecutionStatus to) {
  if (to == docflow::v1::EXECUTION_STATUS_UNSPECIFIED) {
    return false;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (from == docflow::v1::EXECUTION_STATUS_PENDING) {
    return to == docflow::v1::EXECUTION_STATUS_PENDING || to == docflow::v1::EXECUTION_STATUS_RUNNING;
  }
  if (from == docflow::v1::EXECUTION_STATUS_RUNNING) {
    return true;
  }
  return false;
}

const char* StatusName(ExecutionStatus status);

} // namespace docflow::model
