#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/allowance_record.hpp"
#include "internal/db/model/offline_balance_record.hpp"
#include "internal/db/model/pending_transaction_record.hpp"

namespace voucher::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A transaction either commits every write or none

  The DB is the source of truth for:
    pending transactions
    offline balances
    allowances
    device settings
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Pending transactions
  // ---------------------------------------------------------------------

  virtual Result InsertPendingTransaction(Transaction&, const model::PendingTransactionRecord&) = 0;

  virtual std::optional<model::PendingTransactionRecord> GetPendingTransaction(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::PendingTransactionRecord> FindPendingTransactionByVoucher(Transaction&, voucher::v1::TransactionType type,
                                                                                         const std::string& voucher_signature) = 0;

  // Ordered by timestamp, then id.
  virtual std::vector<model::PendingTransactionRecord> ListPendingTransactions(Transaction&) = 0;

  virtual Result UpdatePendingTransactionStatus(Transaction&, const std::string& id, voucher::v1::TransactionStatus status,
                                                const std::string& settlement_tx_hash) = 0;

  virtual Result DeletePendingTransactionsWithStatus(Transaction&, voucher::v1::TransactionStatus status) = 0;

  // ---------------------------------------------------------------------
  // Offline balances (singleton)
  // ---------------------------------------------------------------------

  virtual std::optional<model::OfflineBalanceRecord> GetOfflineBalances(Transaction&) = 0;

  virtual Result UpsertOfflineBalances(Transaction&, const model::OfflineBalanceRecord&) = 0;

  // ---------------------------------------------------------------------
  // Allowances
  // ---------------------------------------------------------------------

  virtual std::optional<model::AllowanceRecord> GetAllowance(Transaction&, const std::string& wallet_address) = 0;

  virtual Result UpsertAllowance(Transaction&, const model::AllowanceRecord&) = 0;

  // ---------------------------------------------------------------------
  // Device settings
  // ---------------------------------------------------------------------

  virtual std::optional<std::string> GetSetting(Transaction&, const std::string& key) = 0;

  virtual Result PutSetting(Transaction&, const std::string& key, const std::string& value) = 0;
};

} // namespace voucher::db
