#pragma once

#include <cstdint>
#include <string>

#include "docflow/v1/types.pb.h"

namespace docflow::db::model {

/*
  Append-only audit trail of a terminal execution.

  Written in the same transaction that reopens the execution for a replay,
  so the terminal outcome that was replaced is never lost.
*/
struct AuditEventRecord {
  std::string execution_id;

  // Assigned by the repository, 1-based per execution.
  uint64_t sequence = 0;

  std::string kind;

  uint32_t from_stage_index = 0;

  docflow::v1::ExecutionStatus previous_status = docflow::v1::EXECUTION_STATUS_UNSPECIFIED;
  uint32_t                     previous_stage_index = 0;
  std::string                  previous_error;

  uint64_t created_at_ms = 0;
};

}
