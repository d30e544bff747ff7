#include "internal/store/execution_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/document_ref.hpp"
#include "internal/model/stage_payload.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/execution_id.hpp"

namespace {

using docflow::db::model::AuditEventRecord;
using docflow::db::model::ExecutionRecord;
using docflow::store::ExecutionStore;
using docflow::v1::EXECUTION_STATUS_FAILED;
using docflow::v1::EXECUTION_STATUS_PENDING;
using docflow::v1::EXECUTION_STATUS_RUNNING;

ExecutionRecord MakeRecord(const std::string& container, const std::string& key) {
  const auto      ref = docflow::model::MakeDocumentRef(container, key);
  ExecutionRecord record;
  record.execution_id = docflow::util::ExecutionIdFor(ref);
  record.container    = container;
  record.key          = key;
  record.status       = EXECUTION_STATUS_PENDING;
  record.payload      = docflow::model::SeedPayload(ref);
  return record;
}

ExecutionStore MakeStore() {
  return ExecutionStore(std::make_shared<docflow::db::memory::MemoryRepository>());
}

void TestCreateLoadAndExists() {
  auto store  = MakeStore();
  auto record = MakeRecord("docs", "a.pdf");

  assert(!store.Exists(docflow::model::MakeDocumentRef("docs", "a.pdf")).has_value());
  store.Create(record);

  assert(store.Exists(docflow::model::MakeDocumentRef("docs", "a.pdf")).value() == record.execution_id);
  const auto loaded = store.Load(record.execution_id);
  assert(loaded.status == EXECUTION_STATUS_PENDING);
  assert(docflow::model::GetString(loaded.payload, "bucket") == "docs");
  assert(loaded.version == 0);

  bool duplicate = false;
  try {
    store.Create(record);
  } catch (const docflow::util::AlreadyExists&) {
    duplicate = true;
  }
  assert(duplicate);

  bool missing = false;
  try {
    store.Load("exec-0000000000000000");
  } catch (const docflow::util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

void TestStaleSaveIsAConflict() {
  auto store  = MakeStore();
  auto record = MakeRecord("docs", "a.pdf");
  store.Create(record);

  auto owner = store.Load(record.execution_id);
  auto stale = store.Load(record.execution_id);

  owner.status = EXECUTION_STATUS_RUNNING;
  store.Save(owner);
  assert(owner.version == 1);

  stale.status = EXECUTION_STATUS_RUNNING;
  bool conflict = false;
  try {
    store.Save(stale);
  } catch (const docflow::util::LeaseConflict&) {
    conflict = true;
  }
  assert(conflict);
  assert(stale.version == 0);

  // The winner keeps writing.
  owner.current_stage_index = 1;
  store.Save(owner);
  assert(store.Load(record.execution_id).current_stage_index == 1);
}

void TestTerminalRecordIsImmutable() {
  auto store  = MakeStore();
  auto record = MakeRecord("docs", "a.pdf");
  store.Create(record);

  record.status     = EXECUTION_STATUS_FAILED;
  record.last_error = "boom";
  store.Save(record);

  record.last_error = "rewritten";
  bool rejected     = false;
  try {
    store.Save(record);
  } catch (const docflow::util::InvalidState&) {
    rejected = true;
  }
  assert(rejected);
  assert(store.Load(record.execution_id).last_error == "boom");
}

void TestReopenAppendsAuditEvent() {
  auto store  = MakeStore();
  auto record = MakeRecord("docs", "a.pdf");
  store.Create(record);

  bool not_terminal = false;
  try {
    store.Reopen(record, AuditEventRecord{record.execution_id});
  } catch (const docflow::util::InvalidState&) {
    not_terminal = true;
  }
  assert(not_terminal);
  assert(store.AuditTrail(record.execution_id).empty());

  record.status              = EXECUTION_STATUS_FAILED;
  record.current_stage_index = 2;
  record.last_error          = "analysis unavailable";
  store.Save(record);

  AuditEventRecord event;
  event.execution_id         = record.execution_id;
  event.kind                 = "replay";
  event.from_stage_index     = 1;
  event.previous_status      = record.status;
  event.previous_stage_index = record.current_stage_index;
  event.previous_error       = record.last_error;

  record.status              = EXECUTION_STATUS_PENDING;
  record.current_stage_index = 1;
  record.last_error.clear();

  assert(store.Reopen(record, event) == 1);

  const auto reopened = store.Load(record.execution_id);
  assert(reopened.status == EXECUTION_STATUS_PENDING);
  assert(reopened.current_stage_index == 1);
  assert(reopened.version == record.version);

  const auto trail = store.AuditTrail(record.execution_id);
  assert(trail.size() == 1);
  assert(trail[0].sequence == 1);
  assert(trail[0].previous_status == EXECUTION_STATUS_FAILED);
  assert(trail[0].previous_error == "analysis unavailable");
  assert(store.List().size() == 1);
}

} // namespace

int main() {
  TestCreateLoadAndExists();
  TestStaleSaveIsAConflict();
  TestTerminalRecordIsImmutable();
  TestReopenAppendsAuditEvent();

  std::cout << "docflow_unit_execution_store: pass\n";
  return 0;
}
