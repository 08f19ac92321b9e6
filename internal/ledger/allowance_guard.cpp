#include "allowance_guard.hpp"

#include "internal/crypto/address.hpp"
#include "internal/observability/logging.hpp"

namespace voucher::ledger {

using voucher::v1::OfflineAllowance;

namespace {

util::Amount StoredAmount(const std::string& text, const std::string& wallet) {
  auto amount = util::Amount::Parse(text);
  if (!amount) throw util::StorageError("corrupt allowance for " + wallet + ": '" + text + "'");
  return *amount;
}

OfflineAllowance ToProto(const db::model::AllowanceRecord& r) {
  OfflineAllowance allowance;
  allowance.set_wallet_address(r.wallet_address);
  allowance.set_limit(r.limit);
  allowance.set_spent(r.spent);
  return allowance;
}

} // namespace

AllowanceGuard::AllowanceGuard(std::shared_ptr<LedgerStore> store, util::Amount default_limit)
    : store_(std::move(store)), default_limit_(default_limit) {
}

OfflineAllowance AllowanceGuard::CheckAndReserve(const std::string& wallet_address, util::Amount amount) {
  return store_->Write([&](db::Transaction& t) { return CheckAndReserve(t, wallet_address, amount); });
}

OfflineAllowance AllowanceGuard::CheckAndReserve(db::Transaction& t, const std::string& wallet_address, util::Amount amount) {
  if (!amount.IsPositive()) throw util::ValidationError("reservation amount must be greater than zero");

  const auto current   = GetAllowance(t, wallet_address);
  const auto limit     = StoredAmount(current.limit(), current.wallet_address());
  const auto spent     = StoredAmount(current.spent(), current.wallet_address());
  const auto available = limit - spent;

  if (amount > available) {
    VOUCHER_LOG_WARN("allowance exceeded", {observability::StringField("wallet", current.wallet_address()),
                                            observability::StringField("requested", amount.ToString()),
                                            observability::StringField("available", available.ToString())});
    throw util::InsufficientAllowance("Insufficient offline allowance: requested " + amount.ToString() + ", available " + available.ToString());
  }

  db::model::AllowanceRecord record;
  record.wallet_address = current.wallet_address();
  record.limit          = limit.ToString();
  record.spent          = (spent + amount).ToString();
  ThrowIfDbError(store_->Repository().UpsertAllowance(t, record), "reserve allowance");
  return ToProto(record);
}

OfflineAllowance AllowanceGuard::GetAllowance(const std::string& wallet_address) {
  return store_->Read([&](db::Transaction& t) { return GetAllowance(t, wallet_address); });
}

OfflineAllowance AllowanceGuard::GetAllowance(db::Transaction& t, const std::string& wallet_address) {
  if (!crypto::IsAddress(wallet_address)) throw util::ValidationError("invalid wallet address '" + wallet_address + "'");

  const auto key = crypto::NormalizeAddress(wallet_address);
  if (auto stored = store_->Repository().GetAllowance(t, key)) {
    return ToProto(*stored);
  }

  db::model::AllowanceRecord fallback;
  fallback.wallet_address = key;
  fallback.limit          = default_limit_.ToString();
  fallback.spent          = util::Amount{}.ToString();
  return ToProto(fallback);
}

OfflineAllowance AllowanceGuard::ResetAllowance(const std::string& wallet_address, util::Amount new_limit) {
  if (!crypto::IsAddress(wallet_address)) throw util::ValidationError("invalid wallet address '" + wallet_address + "'");
  if (new_limit < util::Amount{}) throw util::ValidationError("allowance limit must not be negative");

  db::model::AllowanceRecord record;
  record.wallet_address = crypto::NormalizeAddress(wallet_address);
  record.limit          = new_limit.ToString();
  record.spent          = util::Amount{}.ToString();

  store_->Write([&](db::Transaction& t) { ThrowIfDbError(store_->Repository().UpsertAllowance(t, record), "reset allowance"); });

  VOUCHER_LOG_INFO("allowance reset",
                   {observability::StringField("wallet", record.wallet_address), observability::StringField("limit", record.limit)});
  return ToProto(record);
}

} // namespace voucher::ledger
