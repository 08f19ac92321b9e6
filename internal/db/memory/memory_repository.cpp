#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace voucher::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Pending transactions
// ------------------------------------------------------------------

Result MemoryRepository::InsertPendingTransaction(Transaction& t, const model::PendingTransactionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.pending.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "pending transaction " + r.id);
  for (const auto& [_, existing] : s.pending) {
    if (existing.type == r.type && existing.voucher_signature == r.voucher_signature) {
      return Result::Err(ErrorCode::ConstraintViolation, "voucher already recorded");
    }
  }
  s.pending[r.id] = r;
  return Result::Ok();
}

std::optional<model::PendingTransactionRecord> MemoryRepository::GetPendingTransaction(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.pending.find(id);
  if (it == s.pending.end()) return std::nullopt;
  return it->second;
}

std::optional<model::PendingTransactionRecord> MemoryRepository::FindPendingTransactionByVoucher(Transaction& t, voucher::v1::TransactionType type,
                                                                                                 const std::string& voucher_signature) {
  for (const auto& [_, record] : TX(t).View().pending) {
    if (record.type == type && record.voucher_signature == voucher_signature) return record;
  }
  return std::nullopt;
}

std::vector<model::PendingTransactionRecord> MemoryRepository::ListPendingTransactions(Transaction& t) {
  const auto&                                  s = TX(t).View();
  std::vector<model::PendingTransactionRecord> records;
  records.reserve(s.pending.size());
  for (const auto& [_, record] : s.pending) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    if (a.timestamp_ms != b.timestamp_ms) return a.timestamp_ms < b.timestamp_ms;
    return a.id < b.id;
  });
  return records;
}

Result MemoryRepository::UpdatePendingTransactionStatus(Transaction& t, const std::string& id, voucher::v1::TransactionStatus status,
                                                        const std::string& settlement_tx_hash) {
  auto& s  = TX(t).Mutable();
  auto  it = s.pending.find(id);
  if (it == s.pending.end()) return Result::Err(ErrorCode::NotFound, "pending transaction " + id);
  it->second.status             = status;
  it->second.settlement_tx_hash = settlement_tx_hash;
  return Result::Ok();
}

Result MemoryRepository::DeletePendingTransactionsWithStatus(Transaction& t, voucher::v1::TransactionStatus status) {
  std::erase_if(TX(t).Mutable().pending, [status](const auto& entry) { return entry.second.status == status; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Balances
// ------------------------------------------------------------------

std::optional<model::OfflineBalanceRecord> MemoryRepository::GetOfflineBalances(Transaction& t) {
  return TX(t).View().balances;
}

Result MemoryRepository::UpsertOfflineBalances(Transaction& t, const model::OfflineBalanceRecord& r) {
  TX(t).Mutable().balances = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Allowances
// ------------------------------------------------------------------

std::optional<model::AllowanceRecord> MemoryRepository::GetAllowance(Transaction& t, const std::string& wallet_address) {
  const auto& s  = TX(t).View();
  auto        it = s.allowances.find(wallet_address);
  if (it == s.allowances.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertAllowance(Transaction& t, const model::AllowanceRecord& r) {
  TX(t).Mutable().allowances[r.wallet_address] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Settings
// ------------------------------------------------------------------

std::optional<std::string> MemoryRepository::GetSetting(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.settings.find(key);
  if (it == s.settings.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::PutSetting(Transaction& t, const std::string& key, const std::string& value) {
  TX(t).Mutable().settings[key] = value;
  return Result::Ok();
}

} // namespace voucher::db::memory
