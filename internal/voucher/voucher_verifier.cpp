#include "voucher_verifier.hpp"

#include "internal/codec/voucher_codec.hpp"
#include "internal/crypto/address.hpp"
#include "internal/util/errors.hpp"

namespace voucher::verification {

std::string_view ToString(VerificationFailure failure) {
  switch (failure) {
    case VerificationFailure::kInvalidRecipient:
      return "InvalidRecipient";
    case VerificationFailure::kInvalidSignature:
      return "InvalidSignature";
    case VerificationFailure::kExpired:
      return "Expired";
  }
  return "Unknown";
}

VoucherVerifier::VoucherVerifier(std::shared_ptr<crypto::CryptoCapability> crypto) : crypto_(std::move(crypto)) {
}

VerificationResult VoucherVerifier::Verify(const voucher::v1::Voucher& voucher, const std::string& expected_recipient) {
  return Verify(voucher, expected_recipient, util::NowMillis());
}

VerificationResult VoucherVerifier::Verify(const voucher::v1::Voucher& voucher, const std::string& expected_recipient, int64_t now_ms) {
  if (!crypto::AddressEquals(voucher.to_address(), expected_recipient)) {
    return VerificationResult::Fail(VerificationFailure::kInvalidRecipient, "This voucher is not intended for your address");
  }

  // a key we cannot load cannot match the signed tuple
  std::string ephemeral_address;
  try {
    ephemeral_address = crypto_->DeriveAddress(crypto::SecretKey(voucher.ephemeral_private_key()));
  } catch (const util::CryptoError& e) {
    return VerificationResult::Fail(VerificationFailure::kInvalidSignature, std::string("Invalid voucher key: ") + e.what());
  }

  const auto message = codec::CanonicalSigningMessage(voucher.from_address(), voucher.to_address(), voucher.amount(), voucher.timestamp(),
                                                      ephemeral_address);

  const auto signer = crypto_->RecoverAddress(message, voucher.signature());
  if (!signer || !crypto::AddressEquals(*signer, voucher.from_address())) {
    return VerificationResult::Fail(VerificationFailure::kInvalidSignature, "Invalid voucher signature");
  }

  // exactly kVoucherValidityMs old is still valid; an age past int64 range
  // means the timestamp lies far in the past (or far in the future)
  int64_t age_ms = 0;
  const bool age_overflow = __builtin_sub_overflow(now_ms, voucher.timestamp(), &age_ms);
  if (age_overflow ? voucher.timestamp() < now_ms : age_ms > kVoucherValidityMs) {
    return VerificationResult::Fail(VerificationFailure::kExpired, "Voucher has expired");
  }

  return VerificationResult::Ok();
}

} // namespace voucher::verification
