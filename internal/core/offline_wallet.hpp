#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/crypto/crypto_capability.hpp"
#include "internal/ledger/allowance_guard.hpp"
#include "internal/ledger/ledger_store.hpp"
#include "internal/ledger/local_ledger.hpp"
#include "internal/voucher/voucher_issuer.hpp"
#include "internal/voucher/voucher_verifier.hpp"
#include "voucher/v1.hpp"

namespace voucher::core {

struct IssueResult {
  voucher::v1::Voucher            voucher;
  std::string                     encoded;
  voucher::v1::PendingTransaction transaction;
  voucher::v1::OfflineAllowance   allowance;
};

enum class ReceiveFailure {
  kMalformedVoucher,
  kInvalidRecipient,
  kInvalidSignature,
  kExpired,
  kAlreadyRedeemed,
};

std::string_view ToString(ReceiveFailure failure);

struct ReceiveResult {
  bool                                           accepted = false;
  std::optional<ReceiveFailure>                  reason;
  std::string                                    message;
  std::optional<voucher::v1::PendingTransaction> transaction;
  std::optional<voucher::v1::OfflineBalances>    balances;

  explicit operator bool() const {
    return accepted;
  }
};

/*
  OfflineWallet

  Composes issuance and redemption with their ledger effects. Each
  ledger-affecting call is one LedgerStore::Write: allowance reservation,
  signature, pending transaction and balance update commit together or not
  at all.
*/
class OfflineWallet {
 public:
  OfflineWallet(std::shared_ptr<crypto::CryptoCapability> crypto, std::shared_ptr<ledger::LedgerStore> store,
                std::shared_ptr<ledger::LocalLedger> ledger, std::shared_ptr<ledger::AllowanceGuard> allowance,
                std::shared_ptr<issuance::VoucherIssuer> issuer, std::shared_ptr<verification::VoucherVerifier> verifier);

  // Throws util::ValidationError, util::InsufficientBalance (when an
  // on-chain balance is supplied and too small), util::InsufficientAllowance
  // or util::StorageError. No state changes on any failure.
  IssueResult Issue(const crypto::SecretKey& sender_key, const std::string& to_address, const std::string& amount,
                    const std::optional<std::string>& available_balance = std::nullopt);

  // Verification failures are results and never touch storage.
  // Throws util::StorageError when the accepted voucher cannot be recorded.
  ReceiveResult Receive(const std::string& encoded, const std::string& my_address);
  ReceiveResult Receive(const std::string& encoded, const std::string& my_address, int64_t now_ms);

  // Hands the bearer key of a voucher to its redeemer.
  crypto::KeyPair Redeem(const voucher::v1::Voucher& voucher);

  ledger::LocalLedger& Ledger() {
    return *ledger_;
  }

  ledger::AllowanceGuard& Allowance() {
    return *allowance_;
  }

 private:
  std::shared_ptr<crypto::CryptoCapability>        crypto_;
  std::shared_ptr<ledger::LedgerStore>             store_;
  std::shared_ptr<ledger::LocalLedger>             ledger_;
  std::shared_ptr<ledger::AllowanceGuard>          allowance_;
  std::shared_ptr<issuance::VoucherIssuer>         issuer_;
  std::shared_ptr<verification::VoucherVerifier>   verifier_;
};

} // namespace voucher::core
