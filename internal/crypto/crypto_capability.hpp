#pragma once

#include <optional>
#include <string>

#include "internal/crypto/secret_key.hpp"

namespace voucher::crypto {

struct KeyPair {
  SecretKey   private_key;
  std::string address;
};

/*
  Signing capability consumed by the voucher issuer and verifier.

  Implementations must be safe to call from multiple threads. Failures of
  the underlying library surface as util::CryptoError.
*/
class CryptoCapability {
 public:
  virtual ~CryptoCapability() = default;

  virtual KeyPair GenerateKeypair() = 0;

  virtual std::string DeriveAddress(const SecretKey& private_key) = 0;

  virtual std::string Sign(const SecretKey& private_key, const std::string& message) = 0;

  // Address of the key that produced signature over message; nullopt when
  // the signature does not verify or cannot be parsed.
  virtual std::optional<std::string> RecoverAddress(const std::string& message, const std::string& signature) = 0;
};

} // namespace voucher::crypto
