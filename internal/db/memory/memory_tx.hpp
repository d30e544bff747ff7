#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace docflow::db::memory {

/*
  Transaction = snapshot + write set

  Commit merges only the executions this transaction touched, and fails with
  TransactionConflict when any of them changed in the committed state since
  the snapshot was taken. Transactions on different executions never
  conflict.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  // Must be called before the first mutation of an execution's row or audit trail.
  void Touch(const std::string& execution_id);

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  struct RowSnapshot {
    std::optional<uint64_t> version;
    size_t                  audit_size = 0;
  };

  RowSnapshot SnapshotOf(const MemoryRepository::State& state, const std::string& execution_id) const;

  MemoryRepository&                            repo_;
  MemoryRepository::State                      working_;
  std::unordered_map<std::string, RowSnapshot> touched_;
  bool                                         committed_   = false;
  bool                                         rolled_back_ = false;
};

} // namespace docflow::db::memory
