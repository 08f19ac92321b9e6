#pragma once

#include <memory>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "internal/ledger/ledger_store.hpp"
#include "internal/util/amount.hpp"
#include "voucher/v1.hpp"

namespace voucher::ledger {

/*
  AllowanceGuard

  Per-wallet ceiling on value issued while offline, independent of the
  on-chain balance. The check and the reservation happen in one
  transaction under the LedgerStore writer lock, so two reservations can
  never both pass for amounts that together exceed the limit.

  Wallets without a stored allowance get the configured default limit.
*/
class AllowanceGuard {
 public:
  AllowanceGuard(std::shared_ptr<LedgerStore> store, util::Amount default_limit);

  // Throws util::InsufficientAllowance when amount > limit - spent,
  // util::ValidationError for a non-positive amount.
  voucher::v1::OfflineAllowance CheckAndReserve(const std::string& wallet_address, util::Amount amount);
  voucher::v1::OfflineAllowance CheckAndReserve(db::Transaction& tx, const std::string& wallet_address, util::Amount amount);

  voucher::v1::OfflineAllowance GetAllowance(const std::string& wallet_address);
  voucher::v1::OfflineAllowance GetAllowance(db::Transaction& tx, const std::string& wallet_address);

  // limit = new_limit, spent = 0. Called after settlement.
  voucher::v1::OfflineAllowance ResetAllowance(const std::string& wallet_address, util::Amount new_limit);

  util::Amount DefaultLimit() const {
    return default_limit_;
  }

 private:
  std::shared_ptr<LedgerStore> store_;
  util::Amount                 default_limit_;
};

} // namespace voucher::ledger
