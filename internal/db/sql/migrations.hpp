#pragma once

#include <string>
#include <vector>

namespace voucher::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order.
  Every statement is idempotent, so re-running on an existing ledger is a no-op.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Ledger schema, oldest first.
const std::vector<std::string>& LedgerMigrations();

} // namespace voucher::db::sql
