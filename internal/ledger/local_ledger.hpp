#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "internal/ledger/ledger_store.hpp"
#include "internal/util/amount.hpp"
#include "voucher/v1.hpp"

namespace voucher::ledger {

/*
  LocalLedger

  Append-only pending transaction log plus the cumulative offline
  sent/received totals of this device.

  Every operation comes in two forms: a self-contained one that runs in its
  own LedgerStore::Write/Read, and a Transaction& overload that joins an
  enclosing atomic unit.
*/
class LocalLedger {
 public:
  static constexpr const char* kDeviceIdSetting = "device_id";

  explicit LocalLedger(std::shared_ptr<LedgerStore> store);

  // Throws util::StorageError; nothing is recorded on failure.
  void AddPendingTransaction(const voucher::v1::PendingTransaction& tx);
  void AddPendingTransaction(db::Transaction& tx, const voucher::v1::PendingTransaction& record);

  voucher::v1::OfflineBalances GetOfflineBalances();
  voucher::v1::OfflineBalances GetOfflineBalances(db::Transaction& tx);

  // Replaces the cumulative totals. Both must be valid amounts.
  void UpdateOfflineBalances(const std::string& sent, const std::string& received);
  void UpdateOfflineBalances(db::Transaction& tx, const std::string& sent, const std::string& received);

  // Read-modify-write of the totals inside tx.
  voucher::v1::OfflineBalances AddToOfflineBalances(db::Transaction& tx, util::Amount sent_delta, util::Amount received_delta);

  // Generated on first use, stable afterwards.
  std::string GetDeviceId();
  std::string GetDeviceId(db::Transaction& tx);

  std::vector<voucher::v1::PendingTransaction> ListPendingTransactions();

  std::optional<voucher::v1::PendingTransaction> GetPendingTransaction(const std::string& id);

  std::optional<voucher::v1::PendingTransaction> FindByVoucher(voucher::v1::TransactionType type, const std::string& signature);
  std::optional<voucher::v1::PendingTransaction> FindByVoucher(db::Transaction& tx, voucher::v1::TransactionType type,
                                                               const std::string& signature);

  // Settlement side. Throws util::NotFound for an unknown id.
  void UpdateTransactionStatus(const std::string& id, voucher::v1::TransactionStatus status, const std::string& settlement_tx_hash = {});

  // Totals recomputed from PENDING records only.
  voucher::v1::OfflineBalances RecalculateOfflineBalances();

  void ClearSettledTransactions();

  void ResetOfflineBalances();

 private:
  std::shared_ptr<LedgerStore> store_;
};

} // namespace voucher::ledger
