#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace docflow::db::memory {

namespace {

std::string DocumentKey(const std::string& container, const std::string& key) {
  return container + "#" + key;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertExecution(Transaction& t, const model::ExecutionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.executions.contains(r.execution_id)) return Result::Err(ErrorCode::AlreadyExists, "execution " + r.execution_id);

  const auto doc_key = DocumentKey(r.container, r.key);
  if (s.by_document.contains(doc_key)) return Result::Err(ErrorCode::AlreadyExists, "document " + r.container + "/" + r.key);

  TX(t).Touch(r.execution_id);
  s.executions[r.execution_id] = r;
  s.by_document[doc_key]       = r.execution_id;
  return Result::Ok();
}

std::optional<model::ExecutionRecord> MemoryRepository::GetExecution(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.executions.find(id);
  if (it == s.executions.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ExecutionRecord> MemoryRepository::FindExecutionByDocument(Transaction& t, const std::string& container,
                                                                                const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.by_document.find(DocumentKey(container, key));
  if (it == s.by_document.end()) return std::nullopt;
  return GetExecution(t, it->second);
}

std::vector<model::ExecutionRecord> MemoryRepository::ListExecutions(Transaction& t) {
  const auto&                         s = TX(t).View();
  std::vector<model::ExecutionRecord> records;
  records.reserve(s.executions.size());
  for (const auto& [_, record] : s.executions) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::UpdateExecution(Transaction& t, const model::ExecutionRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.executions.find(r.execution_id);
  if (it == s.executions.end()) return Result::Err(ErrorCode::NotFound, "execution " + r.execution_id);
  if (it->second.version != r.version) {
    return Result::Err(ErrorCode::Conflict, "stale version " + std::to_string(r.version) + " (stored " + std::to_string(it->second.version) + ")");
  }

  TX(t).Touch(r.execution_id);
  it->second         = r;
  it->second.version = r.version + 1;
  return Result::Ok();
}

Result MemoryRepository::AppendAuditEvent(Transaction& t, model::AuditEventRecord& event) {
  auto& s = TX(t).Mutable();
  if (!s.executions.contains(event.execution_id)) return Result::Err(ErrorCode::NotFound, "execution " + event.execution_id);

  TX(t).Touch(event.execution_id);
  auto& events   = s.audit[event.execution_id];
  event.sequence = events.size() + 1;
  events.push_back(event);
  return Result::Ok();
}

std::vector<model::AuditEventRecord> MemoryRepository::ListAuditEvents(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.audit.find(id);
  if (it == s.audit.end()) return {};
  return it->second;
}

} // namespace docflow::db::memory
