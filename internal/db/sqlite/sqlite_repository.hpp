#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace docflow::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates the execution tables if missing and verifies their columns.
  static void BootstrapSchema(SqliteDB& db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
