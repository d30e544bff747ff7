#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/audit_event_record.hpp"
#include "internal/db/model/execution_record.hpp"

namespace docflow::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - UpdateExecution is a compare-and-swap on version:
      stored.version == record.version  -> write, stored.version + 1
      otherwise                         -> ErrorCode::Conflict
  - InsertExecution fails with AlreadyExists for a known execution_id
    or (container, key)

  The DB is the source of truth for:
    execution state
    accumulated payload
    replay audit trail
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Executions
  // ---------------------------------------------------------------------

  virtual Result InsertExecution(Transaction&, const model::ExecutionRecord&) = 0;

  virtual std::optional<model::ExecutionRecord> GetExecution(Transaction&, const std::string& execution_id) = 0;

  virtual std::optional<model::ExecutionRecord> FindExecutionByDocument(Transaction&, const std::string& container,
                                                                        const std::string& key) = 0;

  virtual std::vector<model::ExecutionRecord> ListExecutions(Transaction&) = 0;

  virtual Result UpdateExecution(Transaction&, const model::ExecutionRecord&) = 0;

  // ---------------------------------------------------------------------
  // Audit
  // ---------------------------------------------------------------------

  // Assigns event.sequence.
  virtual Result AppendAuditEvent(Transaction&, model::AuditEventRecord& event) = 0;

  virtual std::vector<model::AuditEventRecord> ListAuditEvents(Transaction&, const std::string& execution_id) = 0;
};

} // namespace docflow::db
