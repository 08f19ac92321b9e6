#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace voucher::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertPendingTransaction(Transaction&, const model::PendingTransactionRecord&) override;
  std::optional<model::PendingTransactionRecord> GetPendingTransaction(Transaction&, const std::string&) override;
  std::optional<model::PendingTransactionRecord> FindPendingTransactionByVoucher(Transaction&, voucher::v1::TransactionType type,
                                                                                 const std::string& voucher_signature) override;
  std::vector<model::PendingTransactionRecord> ListPendingTransactions(Transaction&) override;
  Result UpdatePendingTransactionStatus(Transaction&, const std::string& id, voucher::v1::TransactionStatus status,
                                        const std::string& settlement_tx_hash) override;
  Result DeletePendingTransactionsWithStatus(Transaction&, voucher::v1::TransactionStatus status) override;

  std::optional<model::OfflineBalanceRecord> GetOfflineBalances(Transaction&) override;
  Result UpsertOfflineBalances(Transaction&, const model::OfflineBalanceRecord&) override;

  std::optional<model::AllowanceRecord> GetAllowance(Transaction&, const std::string& wallet_address) override;
  Result UpsertAllowance(Transaction&, const model::AllowanceRecord&) override;

  std::optional<std::string> GetSetting(Transaction&, const std::string& key) override;
  Result PutSetting(Transaction&, const std::string& key, const std::string& value) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace voucher::db::sqlite
