#include "crypto/hash.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "util/error.hpp"
#include "util/hex.hpp"

namespace kasstamp::crypto {

namespace {

// HMAC() reads a null key as "reuse the previous key"; empty keys need a real pointer.
const void* KeyPointer(std::span<const std::uint8_t> key) {
  static const std::uint8_t kEmptyKey = 0;
  return key.empty() ? &kEmptyKey : key.data();
}

}  // namespace

Sha256Hash Sha256(std::span<const std::uint8_t> data) {
  Sha256Hash out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1 ||
      len != out.size()) {
    util::Fail(util::ErrorCode::kCryptoFailure, "EVP_Digest(sha256) failed");
  }
  return out;
}

std::string Sha256Hex(std::span<const std::uint8_t> data) {
  const auto digest = Sha256(data);
  return util::HexEncode(digest);
}

Sha256Hash HmacSha256(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) {
  Sha256Hash out{};
  unsigned int len = 0;
  if (HMAC(EVP_sha256(), KeyPointer(key), static_cast<int>(key.size()), data.data(), data.size(),
           out.data(), &len) == nullptr ||
      len != out.size()) {
    util::Fail(util::ErrorCode::kCryptoFailure, "HMAC(sha256) failed");
  }
  return out;
}

Sha512Hash HmacSha512(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) {
  Sha512Hash out{};
  unsigned int len = 0;
  if (HMAC(EVP_sha512(), KeyPointer(key), static_cast<int>(key.size()), data.data(), data.size(),
           out.data(), &len) == nullptr ||
      len != out.size()) {
    util::Fail(util::ErrorCode::kCryptoFailure, "HMAC(sha512) failed");
  }
  return out;
}

}  // namespace kasstamp::crypto
