#pragma once

#include <cstdint>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "docflow/v1/types.pb.h"

namespace docflow::db::model {

/*
  Persistent execution row.

  IMPORTANT:
  - This is the authoritative state machine record.
  - execution_id is derived from (container, key); at most one row per document.
  - version is bumped by the repository on every successful update and is
    used for optimistic concurrency: an update carrying a stale version fails
    with ErrorCode::Conflict.
*/

struct ExecutionRecord {
  std::string execution_id;

  std::string container;
  std::string key;

  docflow::v1::ExecutionStatus status = docflow::v1::EXECUTION_STATUS_UNSPECIFIED;

  uint32_t current_stage_index = 0;

  // Accumulated stage output (additive-only).
  google::protobuf::Struct payload;

  // Attempts already spent on the current stage.
  uint32_t attempt = 0;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;

  std::string last_error;

  uint64_t version = 0;
};

}
