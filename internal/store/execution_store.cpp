#include "execution_store.hpp"

#include <stdexcept>
#include <type_traits>

#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"

namespace docflow::store {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::SerializationFailure:
      throw util::LeaseConflict(message);
    case db::ErrorCode::Busy:
    case db::ErrorCode::IOError:
    case db::ErrorCode::InternalError:
      throw util::StoreUnavailable(message);
    default:
      throw std::runtime_error(message);
  }
}

/*
  Runs fn inside a transaction. Backend exceptions from Begin/Commit (lock
  timeouts, closed databases) surface as StoreUnavailable; commit-time
  conflicts as LeaseConflict. Our own util:: errors pass through.
*/
template <typename Fn>
auto InTransaction(db::Repository& repository, const std::string& context, Fn&& fn) {
  std::unique_ptr<db::Transaction> tx;
  try {
    tx = repository.Begin();
  } catch (const std::exception& e) {
    throw util::StoreUnavailable(context + ": " + e.what());
  }

  auto commit = [&] {
    try {
      tx->Commit();
    } catch (const db::TransactionConflict& e) {
      throw util::LeaseConflict(context + ": " + e.what());
    } catch (const std::exception& e) {
      throw util::StoreUnavailable(context + ": " + e.what());
    }
  };

  if constexpr (std::is_void_v<decltype(fn(*tx))>) {
    fn(*tx);
    commit();
  } else {
    auto out = fn(*tx);
    commit();
    return out;
  }
}

} // namespace

ExecutionStore::ExecutionStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("execution store requires a repository");
  }
}

db::model::ExecutionRecord ExecutionStore::Load(const std::string& execution_id) {
  auto record = TryLoad(execution_id);
  if (!record) {
    throw util::NotFound("execution not found: " + execution_id);
  }
  return *record;
}

std::optional<db::model::ExecutionRecord> ExecutionStore::TryLoad(const std::string& execution_id) {
  return InTransaction(*repository_, "load execution", [&](db::Transaction& tx) { return repository_->GetExecution(tx, execution_id); });
}

std::optional<std::string> ExecutionStore::Exists(const docflow::v1::DocumentRef& ref) {
  auto record = InTransaction(*repository_, "find execution",
                              [&](db::Transaction& tx) { return repository_->FindExecutionByDocument(tx, ref.container(), ref.key()); });
  if (!record) {
    return std::nullopt;
  }
  return record->execution_id;
}

void ExecutionStore::Create(const db::model::ExecutionRecord& record) {
  try {
    InTransaction(*repository_, "create execution",
                  [&](db::Transaction& tx) { ThrowIfDbError(repository_->InsertExecution(tx, record), "create execution " + record.execution_id); });
  } catch (const util::LeaseConflict& e) {
    // A concurrent transaction inserted the same document first.
    throw util::AlreadyExists(e.what());
  }
}

void ExecutionStore::Save(db::model::ExecutionRecord& record) {
  InTransaction(*repository_, "save execution", [&](db::Transaction& tx) {
    auto stored = repository_->GetExecution(tx, record.execution_id);
    if (!stored) {
      throw util::NotFound("execution not found: " + record.execution_id);
    }
    if (model::IsTerminal(stored->status)) {
      throw util::InvalidState("execution " + record.execution_id + " is " + model::StatusName(stored->status) + " and cannot be modified");
    }
    ThrowIfDbError(repository_->UpdateExecution(tx, record), "save execution " + record.execution_id);
  });
  ++record.version;
}

uint64_t ExecutionStore::Reopen(db::model::ExecutionRecord& record, db::model::AuditEventRecord event) {
  const auto sequence = InTransaction(*repository_, "reopen execution", [&](db::Transaction& tx) {
    auto stored = repository_->GetExecution(tx, record.execution_id);
    if (!stored) {
      throw util::NotFound("execution not found: " + record.execution_id);
    }
    if (!model::IsTerminal(stored->status)) {
      throw util::InvalidState("execution " + record.execution_id + " is " + model::StatusName(stored->status) + ", only terminal executions can be replayed");
    }
    ThrowIfDbError(repository_->AppendAuditEvent(tx, event), "append audit event " + record.execution_id);
    ThrowIfDbError(repository_->UpdateExecution(tx, record), "reopen execution " + record.execution_id);
    return event.sequence;
  });
  ++record.version;
  return sequence;
}

std::vector<db::model::AuditEventRecord> ExecutionStore::AuditTrail(const std::string& execution_id) {
  return InTransaction(*repository_, "list audit events", [&](db::Transaction& tx) { return repository_->ListAuditEvents(tx, execution_id); });
}

std::vector<db::model::ExecutionRecord> ExecutionStore::List() {
  return InTransaction(*repository_, "list executions", [&](db::Transaction& tx) { return repository_->ListExecutions(tx); });
}

} // namespace docflow::store
