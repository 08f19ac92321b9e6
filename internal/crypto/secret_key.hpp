#pragma once

#include <string>

namespace voucher::crypto {

/*
  Private key material.

  Single owner, move-only. The ephemeral key of a voucher IS the value it
  carries: it moves from the issuer into the voucher, and from the voucher
  to the redeemer. Memory is wiped on destruction. Never log Reveal().
*/
class SecretKey {
 public:
  SecretKey() = default;
  explicit SecretKey(std::string material);
  ~SecretKey();

  SecretKey(const SecretKey&)            = delete;
  SecretKey& operator=(const SecretKey&) = delete;

  SecretKey(SecretKey&& other) noexcept;
  SecretKey& operator=(SecretKey&& other) noexcept;

  bool Empty() const {
    return material_.empty();
  }

  const std::string& Reveal() const {
    return material_;
  }

  // Transfers ownership of the material out; this key becomes empty.
  std::string Release() &&;

 private:
  void Wipe() noexcept;

  std::string material_;
};

} // namespace voucher::crypto
