#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docflow/v1/types.pb.h"
#include "internal/db/api/repository.hpp"

namespace docflow::store {

/*
  ExecutionStore

  The orchestrator's view of the execution record store. Each call runs in
  its own repository transaction, and repository results are turned into
  the util:: exception types:

    NotFound          no such execution
    AlreadyExists     Create() lost the race for a document
    LeaseConflict     Save() with a stale version (another writer owns it)
    InvalidState      Save() on a record that is already terminal
    StoreUnavailable  backend busy / unreachable / I/O error (retryable)
*/
class ExecutionStore {
 public:
  explicit ExecutionStore(std::shared_ptr<db::Repository> repository);

  db::model::ExecutionRecord                Load(const std::string& execution_id);
  std::optional<db::model::ExecutionRecord> TryLoad(const std::string& execution_id);

  std::optional<std::string> Exists(const docflow::v1::DocumentRef& ref);

  // Throws AlreadyExists when a record for the id or document exists.
  void Create(const db::model::ExecutionRecord& record);

  // Checkpoint. On success record.version matches the stored version.
  void Save(db::model::ExecutionRecord& record);

  // The only write allowed on a terminal record: appends `event` and stores
  // `record` in one transaction. Returns the audit sequence.
  uint64_t Reopen(db::model::ExecutionRecord& record, db::model::AuditEventRecord event);

  std::vector<db::model::AuditEventRecord> AuditTrail(const std::string& execution_id);
  std::vector<db::model::ExecutionRecord>  List();

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace docflow::store
