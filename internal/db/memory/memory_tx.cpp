#include "memory_tx.hpp"

namespace docflow::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryTransaction::RowSnapshot MemoryTransaction::SnapshotOf(const MemoryRepository::State& state, const std::string& execution_id) const {
  RowSnapshot snapshot;
  if (auto it = state.executions.find(execution_id); it != state.executions.end()) {
    snapshot.version = it->second.version;
  }
  if (auto it = state.audit.find(execution_id); it != state.audit.end()) {
    snapshot.audit_size = it->second.size();
  }
  return snapshot;
}

void MemoryTransaction::Touch(const std::string& execution_id) {
  if (touched_.contains(execution_id)) return;
  touched_.emplace(execution_id, SnapshotOf(working_, execution_id));
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);

  for (const auto& [id, before] : touched_) {
    const auto now = SnapshotOf(repo_.committed_, id);
    if (now.version != before.version || now.audit_size != before.audit_size) {
      throw TransactionConflict("transaction conflict: execution " + id + " was modified by a concurrent transaction");
    }
  }

  for (const auto& [id, _] : touched_) {
    if (auto it = working_.executions.find(id); it != working_.executions.end()) {
      const auto& record = it->second;
      repo_.committed_.executions[id]                                  = record;
      repo_.committed_.by_document[record.container + "#" + record.key] = id;
    }
    if (auto it = working_.audit.find(id); it != working_.audit.end()) {
      repo_.committed_.audit[id] = it->second;
    }
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace docflow::db::memory
