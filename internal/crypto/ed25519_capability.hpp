#pragma once

#include "internal/crypto/crypto_capability.hpp"

namespace voucher::crypto {

/*
  Ed25519 over OpenSSL.

    private key : 0x + hex(32 byte seed)
    address     : 0x + hex(last 20 bytes of SHA3-256(public key))
    signature   : 0x + hex(public key || signature)

  The message is domain separated before signing, see SignedMessageBytes().
  Recovery verifies against the embedded public key and derives its address.
*/
class Ed25519Capability final : public CryptoCapability {
 public:
  KeyPair GenerateKeypair() override;

  std::string DeriveAddress(const SecretKey& private_key) override;

  std::string Sign(const SecretKey& private_key, const std::string& message) override;

  std::optional<std::string> RecoverAddress(const std::string& message, const std::string& signature) override;

  static std::string SignedMessageBytes(const std::string& message);
};

} // namespace voucher::crypto
