#include "migrations.hpp"

namespace voucher::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& LedgerMigrations() {
  static const std::vector<std::string> kMigrations = {
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS pending_transactions (id TEXT PRIMARY KEY, type INTEGER NOT NULL, from_address TEXT NOT NULL, to_address TEXT NOT NULL, "
      "amount TEXT NOT NULL, voucher_json TEXT NOT NULL, voucher_signature TEXT NOT NULL, timestamp_ms INTEGER NOT NULL, status INTEGER NOT NULL, "
      "settlement_tx_hash TEXT NOT NULL DEFAULT '', device_id TEXT NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS pending_transactions_voucher ON pending_transactions(type, voucher_signature);",
      "CREATE INDEX IF NOT EXISTS pending_transactions_status ON pending_transactions(status);",
      "CREATE TABLE IF NOT EXISTS offline_balances (id INTEGER PRIMARY KEY CHECK (id = 1), sent TEXT NOT NULL, received TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS offline_allowances (wallet_address TEXT PRIMARY KEY, limit_amount TEXT NOT NULL, spent TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS settings (key TEXT PRIMARY KEY, value TEXT NOT NULL);",
      "INSERT OR IGNORE INTO schema_migrations(version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};
  return kMigrations;
}

} // namespace voucher::db::sql
