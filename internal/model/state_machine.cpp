#include "state_machine.hpp"

namespace docflow::model {

const char* StatusName(ExecutionStatus status) {
  switch (status) {
    case docflow::v1::EXECUTION_STATUS_PENDING:
      return "pending";
    case docflow::v1::EXECUTION_STATUS_RUNNING:
      return "running";
    case docflow::v1::EXECUTION_STATUS_SUCCEEDED:
      return "succeeded";
    case docflow::v1::EXECUTION_STATUS_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

} // namespace docflow::model
