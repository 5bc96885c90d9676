#include "wallet/enclave_blob.hpp"

#include <algorithm>
#include <limits>

#include "util/aead.hpp"
#include "util/csprng.hpp"
#include "util/error.hpp"
#include "util/pbkdf2.hpp"

namespace kasstamp::wallet {

namespace {

void EncodeU32(std::vector<std::uint8_t>* out, std::size_t offset, std::uint32_t value) {
  (*out)[offset + 0] = static_cast<std::uint8_t>(value & 0xFF);
  (*out)[offset + 1] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
  (*out)[offset + 2] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
  (*out)[offset + 3] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
}

std::uint32_t DecodeU32(std::span<const std::uint8_t> data, std::size_t offset) {
  return static_cast<std::uint32_t>(data[offset + 0]) |
         (static_cast<std::uint32_t>(data[offset + 1]) << 8) |
         (static_cast<std::uint32_t>(data[offset + 2]) << 16) |
         (static_cast<std::uint32_t>(data[offset + 3]) << 24);
}

bool Reject(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
  return false;
}

std::span<const std::uint8_t> AadFor(const EnclaveBlob& blob) {
  if (blob.version == kEnclaveBlobLegacyVersion) {
    return {};
  }
  return blob.salt;
}

}  // namespace

std::vector<std::uint8_t> SerializeEnclaveBlob(const EnclaveBlob& blob) {
  if (blob.salt.size() > std::numeric_limits<std::uint16_t>::max() ||
      blob.cipher.size() > std::numeric_limits<std::uint32_t>::max()) {
    util::Fail(util::ErrorCode::kInvalidArgument, "enclave blob fields too large");
  }
  std::vector<std::uint8_t> out;
  out.reserve(1 + 2 + blob.salt.size() + 4 + blob.cipher.size());
  out.push_back(blob.version);
  const auto salt_len = static_cast<std::uint16_t>(blob.salt.size());
  out.push_back(static_cast<std::uint8_t>(salt_len & 0xFF));
  out.push_back(static_cast<std::uint8_t>((salt_len >> 8) & 0xFF));
  out.insert(out.end(), blob.salt.begin(), blob.salt.end());
  const std::size_t cipher_len_offset = out.size();
  out.resize(out.size() + 4);
  EncodeU32(&out, cipher_len_offset, static_cast<std::uint32_t>(blob.cipher.size()));
  out.insert(out.end(), blob.cipher.begin(), blob.cipher.end());
  return out;
}

bool ParseEnclaveBlob(std::span<const std::uint8_t> bytes, EnclaveBlob* blob,
                      std::string* error) {
  if (bytes.size() < 3) {
    return Reject(error, "enclave blob truncated");
  }
  const std::uint8_t version = bytes[0];
  if (version != kEnclaveBlobLegacyVersion && version != kEnclaveBlobVersion) {
    return Reject(error, "unsupported enclave blob version " + std::to_string(version));
  }
  const std::size_t salt_len = static_cast<std::size_t>(bytes[1]) |
                               (static_cast<std::size_t>(bytes[2]) << 8);
  std::size_t offset = 3;
  if (offset + salt_len + 4 > bytes.size()) {
    return Reject(error, "enclave blob truncated");
  }
  const auto salt = bytes.subspan(offset, salt_len);
  offset += salt_len;
  const std::uint32_t cipher_len = DecodeU32(bytes, offset);
  offset += 4;
  if (cipher_len > bytes.size() - offset) {
    return Reject(error, "enclave blob truncated");
  }
  if (offset + cipher_len != bytes.size()) {
    return Reject(error, "enclave blob has trailing data");
  }
  if (cipher_len < util::kAes256GcmNonceSize + util::kAes256GcmTagSize) {
    return Reject(error, "enclave blob ciphertext too short");
  }
  const std::size_t expected_salt =
      version == kEnclaveBlobVersion ? kEnclaveArgonSaltFieldSize : kEnclaveSaltSize;
  if (salt_len != expected_salt) {
    return Reject(error, "enclave blob salt has unexpected length " + std::to_string(salt_len));
  }
  blob->version = version;
  blob->salt.assign(salt.begin(), salt.end());
  blob->cipher.assign(bytes.begin() + static_cast<std::ptrdiff_t>(offset), bytes.end());
  return true;
}

EnclaveBlob SealMnemonic(const std::string& mnemonic, const std::string& passphrase,
                         const std::string& password, const util::Argon2idParams& params) {
  if (mnemonic.size() > std::numeric_limits<std::uint16_t>::max()) {
    util::Fail(util::ErrorCode::kInvalidArgument, "mnemonic too long");
  }
  std::string param_error;
  if (!util::ValidateArgon2idParams(params, &param_error)) {
    util::Fail(util::ErrorCode::kInvalidArgument, param_error);
  }
  EnclaveBlob blob;
  blob.version = kEnclaveBlobVersion;
  blob.salt.assign(kEnclaveArgonSaltFieldSize, 0);
  const auto salt = util::SecureRandomBytes(kEnclaveSaltSize);
  std::copy(salt.begin(), salt.end(), blob.salt.begin());
  EncodeU32(&blob.salt, 16, params.t_cost);
  EncodeU32(&blob.salt, 20, params.m_cost_kib);
  EncodeU32(&blob.salt, 24, params.parallelism);

  util::SecureBytes plaintext(2 + mnemonic.size() + passphrase.size());
  auto* out = plaintext.data();
  const auto len = static_cast<std::uint16_t>(mnemonic.size());
  out[0] = static_cast<std::uint8_t>(len & 0xFF);
  out[1] = static_cast<std::uint8_t>((len >> 8) & 0xFF);
  std::copy(mnemonic.begin(), mnemonic.end(), out + 2);
  std::copy(passphrase.begin(), passphrase.end(), out + 2 + mnemonic.size());

  const auto key = DeriveWrappingKey(blob, password);
  const auto nonce = util::SecureRandomBytes(util::kAes256GcmNonceSize);
  auto sealed = util::Aes256GcmEncrypt(key.span(), nonce, AadFor(blob), plaintext.span());
  blob.cipher.reserve(nonce.size() + sealed.size());
  blob.cipher.insert(blob.cipher.end(), nonce.begin(), nonce.end());
  blob.cipher.insert(blob.cipher.end(), sealed.begin(), sealed.end());
  return blob;
}

util::SecureBytes DeriveWrappingKey(const EnclaveBlob& blob, const std::string& password) {
  if (blob.version == kEnclaveBlobLegacyVersion) {
    if (blob.salt.size() != kEnclaveSaltSize) {
      util::Fail(util::ErrorCode::kInvalidArgument, "legacy enclave salt must be 16 bytes");
    }
    auto key = util::Pbkdf2HmacSha256(password, blob.salt, kLegacyPbkdf2Iterations,
                                      util::kAes256GcmKeySize);
    util::SecureBytes wrapped(key);
    util::SecureWipe(key);
    return wrapped;
  }
  if (blob.salt.size() != kEnclaveArgonSaltFieldSize) {
    util::Fail(util::ErrorCode::kInvalidArgument, "enclave salt field must be 28 bytes");
  }
  util::Argon2idParams params;
  params.t_cost = DecodeU32(blob.salt, 16);
  params.m_cost_kib = DecodeU32(blob.salt, 20);
  params.parallelism = DecodeU32(blob.salt, 24);
  std::string error;
  if (!util::ValidateArgon2idParams(params, &error)) {
    util::Fail(util::ErrorCode::kInvalidArgument, "enclave blob " + error);
  }
  std::vector<std::uint8_t> key;
  if (!util::DeriveKeyArgon2id(password,
                               std::span<const std::uint8_t>(blob.salt.data(), kEnclaveSaltSize),
                               params, &key, &error)) {
    util::SecureWipe(key);
    util::Fail(util::ErrorCode::kCryptoFailure, "enclave key derivation failed: " + error);
  }
  util::SecureBytes wrapped(key);
  util::SecureWipe(key);
  return wrapped;
}

std::optional<MnemonicSecret> OpenEnclaveBlob(const EnclaveBlob& blob,
                                              const util::SecureBytes& wrapping_key) {
  if (blob.cipher.size() < util::kAes256GcmNonceSize + util::kAes256GcmTagSize) {
    util::Fail(util::ErrorCode::kCiphertextTooShort, "enclave ciphertext too short");
  }
  const std::span<const std::uint8_t> cipher(blob.cipher);
  std::vector<std::uint8_t> plaintext;
  if (!util::Aes256GcmDecrypt(wrapping_key.span(), cipher.first(util::kAes256GcmNonceSize),
                              AadFor(blob), cipher.subspan(util::kAes256GcmNonceSize),
                              &plaintext)) {
    return std::nullopt;
  }
  MnemonicSecret secret;
  if (blob.version == kEnclaveBlobLegacyVersion) {
    secret.mnemonic.assign(plaintext.begin(), plaintext.end());
    util::SecureWipe(plaintext);
    return secret;
  }
  if (plaintext.size() < 2) {
    util::SecureWipe(plaintext);
    util::Fail(util::ErrorCode::kCryptoFailure, "enclave plaintext truncated");
  }
  const std::size_t mnemonic_len = static_cast<std::size_t>(plaintext[0]) |
                                   (static_cast<std::size_t>(plaintext[1]) << 8);
  if (2 + mnemonic_len > plaintext.size()) {
    util::SecureWipe(plaintext);
    util::Fail(util::ErrorCode::kCryptoFailure, "enclave plaintext mnemonic length out of range");
  }
  const auto mnemonic_end = plaintext.begin() + 2 + static_cast<std::ptrdiff_t>(mnemonic_len);
  secret.mnemonic.assign(plaintext.begin() + 2, mnemonic_end);
  secret.passphrase.assign(mnemonic_end, plaintext.end());
  util::SecureWipe(plaintext);
  return secret;
}

}  // namespace kasstamp::wallet
