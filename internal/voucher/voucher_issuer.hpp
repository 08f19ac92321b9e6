#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/crypto/crypto_capability.hpp"
#include "voucher/v1.hpp"

namespace voucher::issuance {

/*
  Creates signed vouchers.

  No ledger side effects: the caller reserves allowance and records the
  pending transaction in the same atomic unit (see core::OfflineWallet).
*/
class VoucherIssuer {
 public:
  explicit VoucherIssuer(std::shared_ptr<crypto::CryptoCapability> crypto);

  // Throws util::ValidationError for a non-positive/malformed amount or a
  // malformed recipient. The returned voucher owns the ephemeral key.
  voucher::v1::Voucher Create(const crypto::SecretKey& sender_key, const std::string& to_address, const std::string& amount);

  voucher::v1::Voucher Create(const crypto::SecretKey& sender_key, const std::string& to_address, const std::string& amount,
                              int64_t timestamp_ms);

 private:
  std::shared_ptr<crypto::CryptoCapability> crypto_;
};

} // namespace voucher::issuance
