#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/crypto/crypto_capability.hpp"
#include "internal/util/time.hpp"
#include "voucher/v1.hpp"

namespace voucher::verification {

inline constexpr int64_t kVoucherValidityMs = 7 * util::kMillisPerDay;

enum class VerificationFailure {
  kInvalidRecipient,
  kInvalidSignature,
  kExpired,
};

std::string_view ToString(VerificationFailure failure);

struct VerificationResult {
  bool                               valid = false;
  std::optional<VerificationFailure> reason;
  std::string                        message;

  static VerificationResult Ok() {
    return {true, std::nullopt, {}};
  }

  static VerificationResult Fail(VerificationFailure failure, std::string msg) {
    return {false, failure, std::move(msg)};
  }

  explicit operator bool() const {
    return valid;
  }
};

/*
  Checks recipient binding, signature and freshness, in that order,
  stopping at the first failure. Never throws for a decoded voucher.
*/
class VoucherVerifier {
 public:
  explicit VoucherVerifier(std::shared_ptr<crypto::CryptoCapability> crypto);

  VerificationResult Verify(const voucher::v1::Voucher& voucher, const std::string& expected_recipient);

  VerificationResult Verify(const voucher::v1::Voucher& voucher, const std::string& expected_recipient, int64_t now_ms);

 private:
  std::shared_ptr<crypto::CryptoCapability> crypto_;
};

} // namespace voucher::verification
