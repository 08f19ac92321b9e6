#include "secret_key.hpp"

#include <openssl/crypto.h>

#include <utility>

namespace voucher::crypto {

SecretKey::SecretKey(std::string material) : material_(std::move(material)) {
}

SecretKey::~SecretKey() {
  Wipe();
}

SecretKey::SecretKey(SecretKey&& other) noexcept : material_(std::move(other.material_)) {
  other.Wipe();
}

SecretKey& SecretKey::operator=(SecretKey&& other) noexcept {
  if (this != &other) {
    Wipe();
    material_ = std::move(other.material_);
    other.Wipe();
  }
  return *this;
}

std::string SecretKey::Release() && {
  std::string out = std::move(material_);
  Wipe();
  return out;
}

void SecretKey::Wipe() noexcept {
  if (!material_.empty()) {
    OPENSSL_cleanse(material_.data(), material_.size());
  }
  material_.clear();
}

} // namespace voucher::crypto
