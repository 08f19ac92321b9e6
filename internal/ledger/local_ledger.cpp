#include "local_ledger.hpp"

#include "internal/codec/voucher_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"

namespace voucher::ledger {

using voucher::v1::OfflineBalances;
using voucher::v1::PendingTransaction;

namespace {

db::model::PendingTransactionRecord ToRecord(const PendingTransaction& tx) {
  db::model::PendingTransactionRecord r;
  r.id                 = tx.id();
  r.type               = tx.type();
  r.from_address       = tx.from_address();
  r.to_address         = tx.to_address();
  r.amount             = tx.amount();
  r.voucher_json       = codec::EncodeVoucher(tx.voucher());
  r.voucher_signature  = tx.voucher().signature();
  r.timestamp_ms       = tx.timestamp();
  r.status             = tx.status();
  r.settlement_tx_hash = tx.settlement_tx_hash();
  r.device_id          = tx.device_id();
  return r;
}

PendingTransaction FromRecord(const db::model::PendingTransactionRecord& r) {
  PendingTransaction tx;
  tx.set_id(r.id);
  tx.set_type(r.type);
  tx.set_from_address(r.from_address);
  tx.set_to_address(r.to_address);
  tx.set_amount(r.amount);
  try {
    *tx.mutable_voucher() = codec::DecodeVoucher(r.voucher_json);
  } catch (const util::MalformedVoucher& e) {
    throw util::StorageError("corrupt voucher in pending transaction " + r.id + ": " + e.what());
  }
  tx.set_timestamp(r.timestamp_ms);
  tx.set_status(r.status);
  tx.set_settlement_tx_hash(r.settlement_tx_hash);
  tx.set_device_id(r.device_id);
  return tx;
}

OfflineBalances FromRecord(const db::model::OfflineBalanceRecord& r) {
  OfflineBalances balances;
  balances.set_sent(r.sent);
  balances.set_received(r.received);
  return balances;
}

util::Amount StoredAmount(const std::string& text, const char* what) {
  auto amount = util::Amount::Parse(text);
  if (!amount) throw util::StorageError(std::string("corrupt ") + what + " amount '" + text + "'");
  return *amount;
}

} // namespace

LocalLedger::LocalLedger(std::shared_ptr<LedgerStore> store) : store_(std::move(store)) {
}

// ------------------------------------------------------------------
// Pending transactions
// ------------------------------------------------------------------

void LocalLedger::AddPendingTransaction(const PendingTransaction& tx) {
  store_->Write([&](db::Transaction& t) { AddPendingTransaction(t, tx); });
}

void LocalLedger::AddPendingTransaction(db::Transaction& t, const PendingTransaction& record) {
  if (record.id().empty()) throw util::ValidationError("pending transaction requires an id");
  ThrowIfDbError(store_->Repository().InsertPendingTransaction(t, ToRecord(record)), "add pending transaction");
  VOUCHER_LOG_DEBUG("pending transaction recorded", {observability::StringField("id", record.id()),
                                                     observability::StringField("type", voucher::v1::TransactionType_Name(record.type())),
                                                     observability::StringField("amount", record.amount())});
}

std::vector<PendingTransaction> LocalLedger::ListPendingTransactions() {
  return store_->Read([&](db::Transaction& t) {
    std::vector<PendingTransaction> out;
    for (const auto& record : store_->Repository().ListPendingTransactions(t)) {
      out.push_back(FromRecord(record));
    }
    return out;
  });
}

std::optional<PendingTransaction> LocalLedger::GetPendingTransaction(const std::string& id) {
  return store_->Read([&](db::Transaction& t) -> std::optional<PendingTransaction> {
    auto record = store_->Repository().GetPendingTransaction(t, id);
    if (!record) return std::nullopt;
    return FromRecord(*record);
  });
}

std::optional<PendingTransaction> LocalLedger::FindByVoucher(voucher::v1::TransactionType type, const std::string& signature) {
  return store_->Read([&](db::Transaction& t) { return FindByVoucher(t, type, signature); });
}

std::optional<PendingTransaction> LocalLedger::FindByVoucher(db::Transaction& t, voucher::v1::TransactionType type, const std::string& signature) {
  auto record = store_->Repository().FindPendingTransactionByVoucher(t, type, signature);
  if (!record) return std::nullopt;
  return FromRecord(*record);
}

void LocalLedger::UpdateTransactionStatus(const std::string& id, voucher::v1::TransactionStatus status, const std::string& settlement_tx_hash) {
  store_->Write([&](db::Transaction& t) {
    ThrowIfDbError(store_->Repository().UpdatePendingTransactionStatus(t, id, status, settlement_tx_hash), "update transaction status");
  });
  VOUCHER_LOG_INFO("transaction status updated",
                   {observability::StringField("id", id), observability::StringField("status", voucher::v1::TransactionStatus_Name(status))});
}

void LocalLedger::ClearSettledTransactions() {
  store_->Write([&](db::Transaction& t) {
    ThrowIfDbError(store_->Repository().DeletePendingTransactionsWithStatus(t, voucher::v1::TRANSACTION_STATUS_SETTLED), "clear settled transactions");
  });
}

// ------------------------------------------------------------------
// Balances
// ------------------------------------------------------------------

OfflineBalances LocalLedger::GetOfflineBalances() {
  return store_->Read([&](db::Transaction& t) { return GetOfflineBalances(t); });
}

OfflineBalances LocalLedger::GetOfflineBalances(db::Transaction& t) {
  auto record = store_->Repository().GetOfflineBalances(t);
  return FromRecord(record.value_or(db::model::OfflineBalanceRecord{}));
}

void LocalLedger::UpdateOfflineBalances(const std::string& sent, const std::string& received) {
  store_->Write([&](db::Transaction& t) { UpdateOfflineBalances(t, sent, received); });
}

void LocalLedger::UpdateOfflineBalances(db::Transaction& t, const std::string& sent, const std::string& received) {
  db::model::OfflineBalanceRecord record;
  record.sent     = util::Amount::ParseOrThrow(sent).ToString();
  record.received = util::Amount::ParseOrThrow(received).ToString();
  ThrowIfDbError(store_->Repository().UpsertOfflineBalances(t, record), "update offline balances");
}

OfflineBalances LocalLedger::AddToOfflineBalances(db::Transaction& t, util::Amount sent_delta, util::Amount received_delta) {
  const auto current  = GetOfflineBalances(t);
  const auto sent     = StoredAmount(current.sent(), "sent") + sent_delta;
  const auto received = StoredAmount(current.received(), "received") + received_delta;
  UpdateOfflineBalances(t, sent.ToString(), received.ToString());

  OfflineBalances updated;
  updated.set_sent(sent.ToString());
  updated.set_received(received.ToString());
  return updated;
}

OfflineBalances LocalLedger::RecalculateOfflineBalances() {
  auto balances = store_->Write([&](db::Transaction& t) {
    util::Amount sent;
    util::Amount received;
    for (const auto& record : store_->Repository().ListPendingTransactions(t)) {
      if (record.status != voucher::v1::TRANSACTION_STATUS_PENDING) continue;
      if (record.type == voucher::v1::TRANSACTION_TYPE_SENT) {
        sent += StoredAmount(record.amount, "pending");
      } else if (record.type == voucher::v1::TRANSACTION_TYPE_RECEIVED) {
        received += StoredAmount(record.amount, "pending");
      }
    }
    UpdateOfflineBalances(t, sent.ToString(), received.ToString());
    return GetOfflineBalances(t);
  });
  VOUCHER_LOG_INFO("offline balances recalculated",
                   {observability::StringField("sent", balances.sent()), observability::StringField("received", balances.received())});
  return balances;
}

void LocalLedger::ResetOfflineBalances() {
  UpdateOfflineBalances(util::Amount{}.ToString(), util::Amount{}.ToString());
}

// ------------------------------------------------------------------
// Device identity
// ------------------------------------------------------------------

std::string LocalLedger::GetDeviceId() {
  return store_->Write([&](db::Transaction& t) { return GetDeviceId(t); });
}

std::string LocalLedger::GetDeviceId(db::Transaction& t) {
  auto& repo = store_->Repository();
  if (auto stored = repo.GetSetting(t, kDeviceIdSetting)) {
    try {
      util::FromString(*stored);
    } catch (const util::ValidationError& e) {
      throw util::StorageError(std::string("corrupt device id: ") + e.what());
    }
    return *stored;
  }

  auto device_id = util::GenerateUUIDString();
  ThrowIfDbError(repo.PutSetting(t, kDeviceIdSetting, device_id), "persist device id");
  VOUCHER_LOG_INFO("device id generated", {observability::StringField("device_id", device_id)});
  return device_id;
}

} // namespace voucher::ledger
