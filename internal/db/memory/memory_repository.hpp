#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace docflow::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertExecution(Transaction&, const model::ExecutionRecord&) override;
  std::optional<model::ExecutionRecord> GetExecution(Transaction&, const std::string&) override;
  std::optional<model::ExecutionRecord> FindExecutionByDocument(Transaction&, const std::string& container,
                                                                const std::string& key) override;
  std::vector<model::ExecutionRecord> ListExecutions(Transaction&) override;
  Result UpdateExecution(Transaction&, const model::ExecutionRecord&) override;

  Result AppendAuditEvent(Transaction&, model::AuditEventRecord& event) override;
  std::vector<model::AuditEventRecord> ListAuditEvents(Transaction&, const std::string& execution_id) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ExecutionRecord>               executions;
    std::unordered_map<std::string, std::string>                          by_document;
    std::unordered_map<std::string, std::vector<model::AuditEventRecord>> audit;
  };

  std::mutex mutex_;
  State committed_;
};

}
