#include "crypto/envelope_crypto.hpp"

#include "crypto/hkdf.hpp"
#include "util/aead.hpp"
#include "util/csprng.hpp"
#include "util/error.hpp"
#include "util/secure_wipe.hpp"

namespace kasstamp::crypto {

namespace {

std::span<const std::uint8_t> AsBytes(std::string_view text) {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

}  // namespace

EnvelopeKey::EnvelopeKey(EnvelopeKey&& other) noexcept : key_(other.key_) {
  util::SecureWipe(other.key_);
}

EnvelopeKey& EnvelopeKey::operator=(EnvelopeKey&& other) noexcept {
  if (this != &other) {
    key_ = other.key_;
    util::SecureWipe(other.key_);
  }
  return *this;
}

EnvelopeKey::~EnvelopeKey() { util::SecureWipe(key_); }

EnvelopeKey DeriveEnvelopeKey(std::span<const std::uint8_t> private_key, std::string_view salt) {
  if (private_key.size() != 32) {
    util::Fail(util::ErrorCode::kInvalidArgument, "envelope key derivation needs a 32-byte key");
  }
  if (salt.empty()) {
    util::Fail(util::ErrorCode::kInvalidArgument, "envelope key derivation needs a unique salt");
  }
  auto derived = HkdfSha256(private_key, AsBytes(salt), AsBytes(kEnvelopeKeyContext));
  EnvelopeKey key(derived);
  util::SecureWipe(derived);
  return key;
}

std::vector<std::uint8_t> EncryptEnvelope(std::span<const std::uint8_t> plaintext,
                                          const EnvelopeKey& key) {
  const auto nonce = util::SecureRandomBytes(util::kAes256GcmNonceSize);
  const auto sealed = util::Aes256GcmEncrypt(key.key_, nonce, {}, plaintext);
  std::vector<std::uint8_t> out;
  out.reserve(nonce.size() + sealed.size());
  out.insert(out.end(), nonce.begin(), nonce.end());
  out.insert(out.end(), sealed.begin(), sealed.end());
  return out;
}

std::vector<std::uint8_t> DecryptEnvelope(std::span<const std::uint8_t> blob,
                                          const EnvelopeKey& key) {
  if (blob.size() < util::kAes256GcmNonceSize) {
    util::Fail(util::ErrorCode::kCiphertextTooShort, "invalid encrypted data: too short");
  }
  if (blob.size() < kEnvelopeOverhead) {
    util::Fail(util::ErrorCode::kCiphertextTooShort,
               "invalid encrypted data: missing authentication tag");
  }
  const auto nonce = blob.first(util::kAes256GcmNonceSize);
  const auto body = blob.subspan(util::kAes256GcmNonceSize);
  std::vector<std::uint8_t> plaintext;
  if (!util::Aes256GcmDecrypt(key.key_, nonce, {}, body, &plaintext)) {
    util::Fail(util::ErrorCode::kAuthenticationFailed,
               "decryption failed: data was tampered with or the key is wrong");
  }
  return plaintext;
}

}  // namespace kasstamp::crypto
