#include "offline_wallet.hpp"

#include "internal/codec/voucher_codec.hpp"
#include "internal/crypto/address.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/amount.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace voucher::core {

using voucher::v1::PendingTransaction;
using voucher::v1::TRANSACTION_STATUS_PENDING;
using voucher::v1::TRANSACTION_TYPE_RECEIVED;
using voucher::v1::TRANSACTION_TYPE_SENT;

namespace {

using observability::StringField;

PendingTransaction MakePending(const voucher::v1::Voucher& voucher, voucher::v1::TransactionType type, const std::string& device_id) {
  PendingTransaction tx;
  tx.set_id(util::GenerateUUIDString());
  tx.set_type(type);
  tx.set_from_address(voucher.from_address());
  tx.set_to_address(voucher.to_address());
  tx.set_amount(voucher.amount());
  *tx.mutable_voucher() = voucher;
  tx.set_timestamp(voucher.timestamp());
  tx.set_status(TRANSACTION_STATUS_PENDING);
  tx.set_device_id(device_id);
  return tx;
}

ReceiveResult Rejected(ReceiveFailure failure, std::string message) {
  ReceiveResult result;
  result.reason  = failure;
  result.message = std::move(message);
  VOUCHER_LOG_WARN("voucher rejected", {StringField("reason", ToString(failure)), StringField("detail", result.message)});
  return result;
}

ReceiveFailure FromVerification(verification::VerificationFailure failure) {
  switch (failure) {
    case verification::VerificationFailure::kInvalidRecipient:
      return ReceiveFailure::kInvalidRecipient;
    case verification::VerificationFailure::kExpired:
      return ReceiveFailure::kExpired;
    case verification::VerificationFailure::kInvalidSignature:
      break;
  }
  return ReceiveFailure::kInvalidSignature;
}

} // namespace

std::string_view ToString(ReceiveFailure failure) {
  switch (failure) {
    case ReceiveFailure::kMalformedVoucher:
      return "MalformedVoucher";
    case ReceiveFailure::kInvalidRecipient:
      return "InvalidRecipient";
    case ReceiveFailure::kInvalidSignature:
      return "InvalidSignature";
    case ReceiveFailure::kExpired:
      return "Expired";
    case ReceiveFailure::kAlreadyRedeemed:
      return "AlreadyRedeemed";
  }
  return "Unknown";
}

OfflineWallet::OfflineWallet(std::shared_ptr<crypto::CryptoCapability> crypto, std::shared_ptr<ledger::LedgerStore> store,
                             std::shared_ptr<ledger::LocalLedger> ledger, std::shared_ptr<ledger::AllowanceGuard> allowance,
                             std::shared_ptr<issuance::VoucherIssuer> issuer, std::shared_ptr<verification::VoucherVerifier> verifier)
    : crypto_(std::move(crypto)),
      store_(std::move(store)),
      ledger_(std::move(ledger)),
      allowance_(std::move(allowance)),
      issuer_(std::move(issuer)),
      verifier_(std::move(verifier)) {
}

IssueResult OfflineWallet::Issue(const crypto::SecretKey& sender_key, const std::string& to_address, const std::string& amount,
                                 const std::optional<std::string>& available_balance) {
  const auto value = util::Amount::ParseOrThrow(amount);
  if (!value.IsPositive()) throw util::ValidationError("amount must be greater than zero");
  if (!crypto::IsAddress(to_address)) throw util::ValidationError("invalid recipient address '" + to_address + "'");

  if (available_balance) {
    const auto balance = util::Amount::ParseOrThrow(*available_balance);
    if (value > balance) {
      throw util::InsufficientBalance("Insufficient balance: requested " + value.ToString() + ", available " + balance.ToString());
    }
  }

  const auto from = crypto_->DeriveAddress(sender_key);

  auto result = store_->Write([&](db::Transaction& t) {
    IssueResult out;
    out.allowance = allowance_->CheckAndReserve(t, from, value);
    out.voucher   = issuer_->Create(sender_key, to_address, value.ToString());
    out.encoded   = codec::EncodeVoucher(out.voucher);

    out.transaction = MakePending(out.voucher, TRANSACTION_TYPE_SENT, ledger_->GetDeviceId(t));
    ledger_->AddPendingTransaction(t, out.transaction);
    ledger_->AddToOfflineBalances(t, value, util::Amount{});
    return out;
  });

  VOUCHER_LOG_INFO("voucher issued", {StringField("tx_id", result.transaction.id()), StringField("from", from), StringField("to", to_address),
                                      StringField("amount", result.voucher.amount())});
  return result;
}

ReceiveResult OfflineWallet::Receive(const std::string& encoded, const std::string& my_address) {
  return Receive(encoded, my_address, util::NowMillis());
}

ReceiveResult OfflineWallet::Receive(const std::string& encoded, const std::string& my_address, int64_t now_ms) {
  voucher::v1::Voucher voucher;
  try {
    voucher = codec::DecodeVoucher(encoded);
  } catch (const util::MalformedVoucher& e) {
    return Rejected(ReceiveFailure::kMalformedVoucher, e.what());
  }

  const auto verdict = verifier_->Verify(voucher, my_address, now_ms);
  if (!verdict) {
    return Rejected(FromVerification(*verdict.reason), verdict.message);
  }

  const auto value = util::Amount::ParseOrThrow(voucher.amount());

  auto result = store_->Write([&](db::Transaction& t) {
    ReceiveResult out;
    if (ledger_->FindByVoucher(t, TRANSACTION_TYPE_RECEIVED, voucher.signature())) {
      out.reason  = ReceiveFailure::kAlreadyRedeemed;
      out.message = "Voucher has already been redeemed on this device";
      return out;
    }

    out.transaction = MakePending(voucher, TRANSACTION_TYPE_RECEIVED, ledger_->GetDeviceId(t));
    ledger_->AddPendingTransaction(t, *out.transaction);
    out.balances = ledger_->AddToOfflineBalances(t, util::Amount{}, value);
    out.accepted = true;
    return out;
  });

  if (!result.accepted) {
    VOUCHER_LOG_WARN("voucher rejected", {StringField("reason", ToString(*result.reason)), StringField("detail", result.message)});
    return result;
  }

  VOUCHER_LOG_INFO("voucher received", {StringField("tx_id", result.transaction->id()), StringField("from", voucher.from_address()),
                                        StringField("amount", voucher.amount())});
  return result;
}

crypto::KeyPair OfflineWallet::Redeem(const voucher::v1::Voucher& voucher) {
  crypto::SecretKey key(voucher.ephemeral_private_key());
  auto              address = crypto_->DeriveAddress(key);
  return crypto::KeyPair{std::move(key), std::move(address)};
}

} // namespace voucher::core
