#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/audit_event_record.hpp"
#include "internal/db/model/execution_record.hpp"

#if DOCFLOW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using docflow::db::ErrorCode;
using docflow::db::Repository;
using docflow::db::memory::MemoryRepository;
using docflow::db::model::AuditEventRecord;
using docflow::db::model::ExecutionRecord;
using docflow::v1::EXECUTION_STATUS_FAILED;
using docflow::v1::EXECUTION_STATUS_PENDING;
using docflow::v1::EXECUTION_STATUS_RUNNING;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

ExecutionRecord MakeRecord(const std::string& id, const std::string& key) {
  ExecutionRecord record;
  record.execution_id  = id;
  record.container     = "docs";
  record.key           = key;
  record.status        = EXECUTION_STATUS_PENDING;
  record.created_at_ms = NowMs();
  record.updated_at_ms = record.created_at_ms;
  (*record.payload.mutable_fields())["bucket"].set_string_value("docs");
  (*record.payload.mutable_fields())["key"].set_string_value(key);
  return record;
}

void VerifyInsertGetFind(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();

  auto record = MakeRecord(id, id + ".pdf");
  assert(repo.InsertExecution(*tx, record));

  auto loaded = repo.GetExecution(*tx, id);
  assert(loaded.has_value());
  assert(loaded->container == "docs");
  assert(loaded->key == id + ".pdf");
  assert(loaded->status == EXECUTION_STATUS_PENDING);
  assert(loaded->payload.fields().at("key").string_value() == id + ".pdf");

  auto by_document = repo.FindExecutionByDocument(*tx, "docs", id + ".pdf");
  assert(by_document.has_value());
  assert(by_document->execution_id == id);
  assert(!repo.FindExecutionByDocument(*tx, "other", id + ".pdf").has_value());

  tx->Commit();
}

void VerifyDuplicateInsert(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  assert(repo.InsertExecution(*tx, MakeRecord(id, id + ".pdf")));

  const auto same_id = repo.InsertExecution(*tx, MakeRecord(id, id + "-other.pdf"));
  assert(!same_id);
  assert(same_id.code == ErrorCode::AlreadyExists);

  const auto same_document = repo.InsertExecution(*tx, MakeRecord(id + "-2", id + ".pdf"));
  assert(!same_document);
  assert(same_document.code == ErrorCode::AlreadyExists);

  tx->Commit();
}

void VerifyVersionedUpdate(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertExecution(*tx, MakeRecord(id, id + ".pdf")));
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto record = repo.GetExecution(*tx, id);
  assert(record.has_value());
  const auto version = record->version;

  record->status              = EXECUTION_STATUS_RUNNING;
  record->current_stage_index = 2;
  record->attempt             = 1;
  record->last_error          = "provider throttled";
  (*record->payload.mutable_fields())["text"].set_string_value("Hello world");
  assert(repo.UpdateExecution(*tx, *record));

  // Same version again: the first write already bumped it.
  const auto stale = repo.UpdateExecution(*tx, *record);
  assert(!stale);
  assert(stale.code == ErrorCode::Conflict);

  auto updated = repo.GetExecution(*tx, id);
  assert(updated->version == version + 1);
  assert(updated->status == EXECUTION_STATUS_RUNNING);
  assert(updated->current_stage_index == 2);
  assert(updated->attempt == 1);
  assert(updated->last_error == "provider throttled");
  assert(updated->payload.fields().at("text").string_value() == "Hello world");

  auto missing = MakeRecord(id + "-missing", id + "-missing.pdf");
  assert(repo.UpdateExecution(*tx, missing).code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyAuditTrail(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  assert(repo.InsertExecution(*tx, MakeRecord(id, id + ".pdf")));

  for (uint64_t expected = 1; expected <= 3; ++expected) {
    AuditEventRecord event;
    event.execution_id         = id;
    event.kind                 = "replay";
    event.from_stage_index     = static_cast<uint32_t>(expected);
    event.previous_status      = EXECUTION_STATUS_FAILED;
    event.previous_stage_index = 3;
    event.previous_error       = "failure " + std::to_string(expected);
    event.created_at_ms        = NowMs();
    assert(repo.AppendAuditEvent(*tx, event));
    assert(event.sequence == expected);
  }

  AuditEventRecord orphan;
  orphan.execution_id = id + "-missing";
  orphan.kind         = "replay";
  assert(repo.AppendAuditEvent(*tx, orphan).code == ErrorCode::NotFound);

  const auto events = repo.ListAuditEvents(*tx, id);
  assert(events.size() == 3);
  assert(events[0].sequence == 1);
  assert(events[2].from_stage_index == 3);
  assert(events[1].previous_status == EXECUTION_STATUS_FAILED);
  assert(events[1].previous_error == "failure 2");
  assert(repo.ListAuditEvents(*tx, id + "-missing").empty());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertExecution(*tx, MakeRecord(id, id + ".pdf")));
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetExecution(*check_tx, id).has_value());
  assert(!repo.FindExecutionByDocument(*check_tx, "docs", id + ".pdf").has_value());
  check_tx->Commit();
}

void VerifyConcurrentUpdates(Repository& repo, const std::string& id, bool supports_parallel_transactions) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertExecution(*tx, MakeRecord(id, id + ".pdf")));
    tx->Commit();
  }

  // Serializing backends cannot interleave two transactions on one thread.
  if (!supports_parallel_transactions) {
    return;
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  auto r1 = repo.GetExecution(*tx1, id);
  auto r2 = repo.GetExecution(*tx2, id);
  assert(r1.has_value() && r2.has_value());

  r1->last_error = "first";
  r2->last_error = "second";

  assert(repo.UpdateExecution(*tx1, *r1));
  tx1->Commit();

  bool conflicted = false;
  try {
    const auto second = repo.UpdateExecution(*tx2, *r2);
    if (!second) {
      conflicted = true;
    } else {
      tx2->Commit();
    }
  } catch (const docflow::db::TransactionConflict&) {
    conflicted = true;
  }
  assert(conflicted);

  auto verify_tx = repo.Begin();
  auto final     = repo.GetExecution(*verify_tx, id);
  assert(final.has_value());
  assert(final->last_error == "first");
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();

    auto record                = MakeRecord(id, id + ".pdf");
    record.status              = EXECUTION_STATUS_FAILED;
    record.current_stage_index = 3;
    record.attempt             = 3;
    record.last_error          = "object store write throttled";
    assert(repo->InsertExecution(*tx, record));

    AuditEventRecord event;
    event.execution_id    = id;
    event.kind            = "replay";
    event.previous_status = EXECUTION_STATUS_FAILED;
    event.created_at_ms   = NowMs();
    assert(repo->AppendAuditEvent(*tx, event));

    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto r  = repo->GetExecution(*tx, id);
  assert(r.has_value());
  assert(r->status == EXECUTION_STATUS_FAILED);
  assert(r->current_stage_index == 3);
  assert(r->attempt == 3);
  assert(r->last_error == "object store write throttled");
  assert(r->payload.fields().at("bucket").string_value() == "docs");

  assert(repo->ListAuditEvents(*tx, id).size() == 1);
  assert(repo->ListExecutions(*tx).size() >= 1);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if DOCFLOW_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("docflow_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<docflow::db::sqlite::SqliteDB>(db_path);
    docflow::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<docflow::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      .supports_parallel_transactions = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyInsertGetFind(*repo, backend.name + "-insert");
    VerifyDuplicateInsert(*repo, backend.name + "-duplicate");
    VerifyVersionedUpdate(*repo, backend.name + "-update");
    VerifyAuditTrail(*repo, backend.name + "-audit");
    VerifyRollbackBehavior(*repo, backend.name + "-rollback");
    VerifyConcurrentUpdates(*repo, backend.name + "-concurrency", backend.supports_parallel_transactions);
  }

  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if DOCFLOW_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "docflow_integration_repository_parity: pass\n";
  return 0;
}
