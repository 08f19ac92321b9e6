#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace voucher::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::PendingTransactionRecord> pending;
    std::optional<model::OfflineBalanceRecord>                       balances;
    std::unordered_map<std::string, model::AllowanceRecord>          allowances;
    std::map<std::string, std::string>                               settings;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace voucher::db::memory
