#include "voucher_issuer.hpp"

#include "internal/codec/voucher_codec.hpp"
#include "internal/crypto/address.hpp"
#include "internal/util/amount.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace voucher::issuance {

VoucherIssuer::VoucherIssuer(std::shared_ptr<crypto::CryptoCapability> crypto) : crypto_(std::move(crypto)) {
}

voucher::v1::Voucher VoucherIssuer::Create(const crypto::SecretKey& sender_key, const std::string& to_address, const std::string& amount) {
  return Create(sender_key, to_address, amount, util::NowMillis());
}

voucher::v1::Voucher VoucherIssuer::Create(const crypto::SecretKey& sender_key, const std::string& to_address, const std::string& amount,
                                           int64_t timestamp_ms) {
  const auto parsed = util::Amount::ParseOrThrow(amount);
  if (!parsed.IsPositive()) {
    throw util::ValidationError("amount must be greater than zero");
  }
  if (!crypto::IsAddress(to_address)) {
    throw util::ValidationError("invalid recipient address '" + to_address + "'");
  }

  const auto from      = crypto_->DeriveAddress(sender_key);
  auto       ephemeral = crypto_->GenerateKeypair();
  const auto canonical = parsed.ToString();

  const auto message = codec::CanonicalSigningMessage(from, to_address, canonical, timestamp_ms, ephemeral.address);

  voucher::v1::Voucher voucher;
  voucher.set_version(voucher::v1::kVoucherVersion);
  voucher.set_amount(canonical);
  voucher.set_from_address(from);
  voucher.set_to_address(to_address);
  voucher.set_timestamp(timestamp_ms);
  voucher.set_signature(crypto_->Sign(sender_key, message));
  voucher.set_ephemeral_private_key(std::move(ephemeral.private_key).Release());
  return voucher;
}

} // namespace voucher::issuance
