#include "ed25519_capability.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <memory>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace voucher::crypto {

namespace {

constexpr size_t kSeedBytes      = 32;
constexpr size_t kPublicKeyBytes = 32;
constexpr size_t kSignatureBytes = 64;
constexpr size_t kAddressBytes   = 20;

constexpr char kMessagePrefix[] = "\x19Offline Voucher Signed Message:\n";

struct EvpPkeyDeleter {
  void operator()(EVP_PKEY* key) const {
    EVP_PKEY_free(key);
  }
};

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using PkeyPtr  = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

// Seed bytes wiped on scope exit.
class SeedBuffer {
 public:
  ~SeedBuffer() {
    OPENSSL_cleanse(bytes.data(), bytes.size());
  }
  std::vector<uint8_t> bytes;
};

PkeyPtr PrivateKeyFromSecret(const SecretKey& secret) {
  SeedBuffer seed;
  if (!util::HexDecode(secret.Reveal(), &seed.bytes) || seed.bytes.size() != kSeedBytes) {
    throw util::CryptoError("private key must be 32 bytes of hex");
  }

  PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.bytes.data(), seed.bytes.size()));
  if (!key) throw util::CryptoError("EVP_PKEY_new_raw_private_key failed");
  return key;
}

std::array<uint8_t, kPublicKeyBytes> RawPublicKey(EVP_PKEY* key) {
  std::array<uint8_t, kPublicKeyBytes> pub{};
  size_t                               len = pub.size();
  if (EVP_PKEY_get_raw_public_key(key, pub.data(), &len) != 1 || len != pub.size()) {
    throw util::CryptoError("EVP_PKEY_get_raw_public_key failed");
  }
  return pub;
}

std::string AddressFromPublicKey(std::span<const uint8_t> pub) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;
  if (EVP_Digest(pub.data(), pub.size(), digest, &digest_len, EVP_sha3_256(), nullptr) != 1 || digest_len < kAddressBytes) {
    throw util::CryptoError("EVP_Digest(sha3-256) failed");
  }
  return "0x" + util::HexEncode(std::span<const uint8_t>(digest + digest_len - kAddressBytes, kAddressBytes));
}

} // namespace

std::string Ed25519Capability::SignedMessageBytes(const std::string& message) {
  return std::string(kMessagePrefix) + std::to_string(message.size()) + message;
}

KeyPair Ed25519Capability::GenerateKeypair() {
  SeedBuffer seed;
  seed.bytes.resize(kSeedBytes);
  if (RAND_bytes(seed.bytes.data(), static_cast<int>(seed.bytes.size())) != 1) {
    throw util::CryptoError("RAND_bytes failed");
  }

  KeyPair pair;
  pair.private_key = SecretKey("0x" + util::HexEncode(seed.bytes));
  pair.address     = DeriveAddress(pair.private_key);
  return pair;
}

std::string Ed25519Capability::DeriveAddress(const SecretKey& private_key) {
  auto key = PrivateKeyFromSecret(private_key);
  auto pub = RawPublicKey(key.get());
  return AddressFromPublicKey(pub);
}

std::string Ed25519Capability::Sign(const SecretKey& private_key, const std::string& message) {
  auto key = PrivateKeyFromSecret(private_key);
  auto pub = RawPublicKey(key.get());

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) throw util::CryptoError("EVP_MD_CTX_new failed");
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    throw util::CryptoError("EVP_DigestSignInit failed");
  }

  const auto                           bytes = SignedMessageBytes(message);
  std::array<uint8_t, kSignatureBytes> sig{};
  size_t                               sig_len = sig.size();
  if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len, reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size()) != 1 ||
      sig_len != sig.size()) {
    throw util::CryptoError("EVP_DigestSign failed");
  }

  std::vector<uint8_t> packed(pub.begin(), pub.end());
  packed.insert(packed.end(), sig.begin(), sig.end());
  return "0x" + util::HexEncode(packed);
}

std::optional<std::string> Ed25519Capability::RecoverAddress(const std::string& message, const std::string& signature) {
  std::vector<uint8_t> packed;
  if (!util::HexDecode(signature, &packed) || packed.size() != kPublicKeyBytes + kSignatureBytes) {
    return std::nullopt;
  }

  PkeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, packed.data(), kPublicKeyBytes));
  if (!key) return std::nullopt;

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) throw util::CryptoError("EVP_MD_CTX_new failed");
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    throw util::CryptoError("EVP_DigestVerifyInit failed");
  }

  const auto bytes = SignedMessageBytes(message);
  const int  rc    = EVP_DigestVerify(ctx.get(), packed.data() + kPublicKeyBytes, kSignatureBytes,
                                      reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
  if (rc != 1) {
    return std::nullopt;
  }

  return AddressFromPublicKey(std::span<const uint8_t>(packed.data(), kPublicKeyBytes));
}

} // namespace voucher::crypto
