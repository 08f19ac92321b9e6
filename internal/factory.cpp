#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/crypto/ed25519_capability.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/amount.hpp"

namespace voucher::factory {

namespace {

constexpr const char* kDefaultLedgerPath = "./voucher-ledger.db";

std::shared_ptr<db::Repository> OpenSqlite(const std::string& path, bool wal_mode) {
  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path, wal_mode);
  db::sql::RunMigrations(*sqlite_db, db::sql::LedgerMigrations());
  VOUCHER_LOG_INFO("ledger opened", {observability::StringField("backend", "sqlite"), observability::StringField("path", path)});
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const voucher::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_memory()) {
    VOUCHER_LOG_INFO("ledger opened", {observability::StringField("backend", "memory")});
    return std::make_shared<db::memory::MemoryRepository>();
  }

  if (database.has_sqlite()) {
    return OpenSqlite(database.sqlite().path(), database.sqlite().wal_mode());
  }

  return OpenSqlite(kDefaultLedgerPath, true);
}

/*
    Build full application dependency graph
*/
Application Build(const voucher::runtime::config::RuntimeConfig& config) {
  return Build(config, BuildRepository(config));
}

Application Build(const voucher::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository) {
  Application app;

  const auto& limit_text    = config.allowance().default_limit();
  const auto  default_limit = limit_text.empty() ? util::Amount{} : util::Amount::ParseOrThrow(limit_text);

  // ------------------------------------------------------------------
  // Ledger
  // ------------------------------------------------------------------
  app.repository = std::move(repository);
  app.store      = std::make_shared<ledger::LedgerStore>(app.repository);
  app.ledger     = std::make_shared<ledger::LocalLedger>(app.store);
  app.allowance  = std::make_shared<ledger::AllowanceGuard>(app.store, default_limit);

  // ------------------------------------------------------------------
  // Protocol
  // ------------------------------------------------------------------
  app.crypto   = std::make_shared<crypto::Ed25519Capability>();
  app.issuer   = std::make_shared<issuance::VoucherIssuer>(app.crypto);
  app.verifier = std::make_shared<verification::VoucherVerifier>(app.crypto);

  app.wallet = std::make_shared<core::OfflineWallet>(app.crypto, app.store, app.ledger, app.allowance, app.issuer, app.verifier);

  return app;
}

} // namespace voucher::factory
