#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/errors.hpp"

namespace voucher::db::sqlite {

using voucher::db::ErrorCode;
using voucher::db::Result;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return nullptr;
  }
  return Statement(st);
}

// Reads have no Result to carry the failure; surface it as StorageError.
Statement PrepareOrThrow(sqlite3* db, const char* sql) {
  auto st = Prepare(db, sql);
  if (!st) throw util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  return st;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

// Steps a read statement; ROW and DONE are the only non-error outcomes.
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw util::StorageError(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

constexpr const char* kPendingColumns =
    "id,type,from_address,to_address,amount,voucher_json,voucher_signature,timestamp_ms,status,settlement_tx_hash,device_id";

model::PendingTransactionRecord ReadPending(sqlite3_stmt* st) {
  model::PendingTransactionRecord r;
  r.id                 = ColText(st, 0);
  r.type               = static_cast<voucher::v1::TransactionType>(ColI32(st, 1));
  r.from_address       = ColText(st, 2);
  r.to_address         = ColText(st, 3);
  r.amount             = ColText(st, 4);
  r.voucher_json       = ColText(st, 5);
  r.voucher_signature  = ColText(st, 6);
  r.timestamp_ms       = ColI64(st, 7);
  r.status             = static_cast<voucher::v1::TransactionStatus>(ColI32(st, 8));
  r.settlement_tx_hash = ColText(st, 9);
  r.device_id          = ColText(st, 10);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Pending transactions
// ------------------------------------------------------------------

Result SqliteRepository::InsertPendingTransaction(Transaction& t, const model::PendingTransactionRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO pending_transactions(") + kPendingColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?);";

  auto st = Prepare(db, sql.c_str());
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindI32(st.get(), 2, static_cast<int>(r.type));
  BindText(st.get(), 3, r.from_address);
  BindText(st.get(), 4, r.to_address);
  BindText(st.get(), 5, r.amount);
  BindText(st.get(), 6, r.voucher_json);
  BindText(st.get(), 7, r.voucher_signature);
  BindI64(st.get(), 8, r.timestamp_ms);
  BindI32(st.get(), 9, static_cast<int>(r.status));
  BindText(st.get(), 10, r.settlement_tx_hash);
  BindText(st.get(), 11, r.device_id);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::PendingTransactionRecord> SqliteRepository::GetPendingTransaction(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kPendingColumns + " FROM pending_transactions WHERE id=?;";

  auto st = PrepareOrThrow(db, sql.c_str());
  BindText(st.get(), 1, id);

  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadPending(st.get());
}

std::optional<model::PendingTransactionRecord> SqliteRepository::FindPendingTransactionByVoucher(Transaction& t, voucher::v1::TransactionType type,
                                                                                                 const std::string& voucher_signature) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kPendingColumns + " FROM pending_transactions WHERE type=? AND voucher_signature=?;";

  auto st = PrepareOrThrow(db, sql.c_str());
  BindI32(st.get(), 1, static_cast<int>(type));
  BindText(st.get(), 2, voucher_signature);

  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadPending(st.get());
}

std::vector<model::PendingTransactionRecord> SqliteRepository::ListPendingTransactions(Transaction& t) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kPendingColumns + " FROM pending_transactions ORDER BY timestamp_ms, id;";

  auto st = PrepareOrThrow(db, sql.c_str());

  std::vector<model::PendingTransactionRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back(ReadPending(st.get()));
  }
  return out;
}

Result SqliteRepository::UpdatePendingTransactionStatus(Transaction& t, const std::string& id, voucher::v1::TransactionStatus status,
                                                        const std::string& settlement_tx_hash) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "UPDATE pending_transactions SET status=?, settlement_tx_hash=? WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(st.get(), 1, static_cast<int>(status));
  BindText(st.get(), 2, settlement_tx_hash);
  BindText(st.get(), 3, id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "pending transaction " + id);
  return Result::Ok();
}

Result SqliteRepository::DeletePendingTransactionsWithStatus(Transaction& t, voucher::v1::TransactionStatus status) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "DELETE FROM pending_transactions WHERE status=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(st.get(), 1, static_cast<int>(status));
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Balances
// ------------------------------------------------------------------

std::optional<model::OfflineBalanceRecord> SqliteRepository::GetOfflineBalances(Transaction& t) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrThrow(db, "SELECT sent,received FROM offline_balances WHERE id=1;");
  if (!StepRow(db, st.get())) return std::nullopt;

  model::OfflineBalanceRecord r;
  r.sent     = ColText(st.get(), 0);
  r.received = ColText(st.get(), 1);
  return r;
}

Result SqliteRepository::UpsertOfflineBalances(Transaction& t, const model::OfflineBalanceRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO offline_balances(id,sent,received) VALUES(1,?,?) "
                    "ON CONFLICT(id) DO UPDATE SET sent=excluded.sent, received=excluded.received;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.sent);
  BindText(st.get(), 2, r.received);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Allowances
// ------------------------------------------------------------------

std::optional<model::AllowanceRecord> SqliteRepository::GetAllowance(Transaction& t, const std::string& wallet_address) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrThrow(db, "SELECT wallet_address,limit_amount,spent FROM offline_allowances WHERE wallet_address=?;");
  BindText(st.get(), 1, wallet_address);
  if (!StepRow(db, st.get())) return std::nullopt;

  model::AllowanceRecord r;
  r.wallet_address = ColText(st.get(), 0);
  r.limit          = ColText(st.get(), 1);
  r.spent          = ColText(st.get(), 2);
  return r;
}

Result SqliteRepository::UpsertAllowance(Transaction& t, const model::AllowanceRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO offline_allowances(wallet_address,limit_amount,spent) VALUES(?,?,?) "
                    "ON CONFLICT(wallet_address) DO UPDATE SET limit_amount=excluded.limit_amount, spent=excluded.spent;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.wallet_address);
  BindText(st.get(), 2, r.limit);
  BindText(st.get(), 3, r.spent);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Settings
// ------------------------------------------------------------------

std::optional<std::string> SqliteRepository::GetSetting(Transaction& t, const std::string& key) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrThrow(db, "SELECT value FROM settings WHERE key=?;");
  BindText(st.get(), 1, key);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ColText(st.get(), 0);
}

Result SqliteRepository::PutSetting(Transaction& t, const std::string& key, const std::string& value) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "INSERT INTO settings(key,value) VALUES(?,?) ON CONFLICT(key) DO UPDATE SET value=excluded.value;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, key);
  BindText(st.get(), 2, value);
  return Translate(db, sqlite3_step(st.get()));
}

} // namespace voucher::db::sqlite
