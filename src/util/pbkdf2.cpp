#include "util/pbkdf2.hpp"

#include <limits>

#include <openssl/evp.h>

#include "util/error.hpp"

namespace kasstamp::util {

namespace {

std::vector<std::uint8_t> Pbkdf2(const EVP_MD* md, const std::string& password,
                                 std::span<const std::uint8_t> salt,
                                 std::uint32_t iterations, std::size_t dk_len) {
  if (iterations == 0 || dk_len == 0) {
    Fail(ErrorCode::kInvalidArgument, "pbkdf2 requires iterations and output length");
  }
  if (password.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()) ||
      salt.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()) ||
      iterations > static_cast<std::uint32_t>(std::numeric_limits<int>::max())) {
    Fail(ErrorCode::kInvalidArgument, "pbkdf2 input too large");
  }
  std::vector<std::uint8_t> out(dk_len);
  const int rc = PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                                   salt.data(), static_cast<int>(salt.size()),
                                   static_cast<int>(iterations), md,
                                   static_cast<int>(out.size()), out.data());
  if (rc != 1) {
    Fail(ErrorCode::kCryptoFailure, "PKCS5_PBKDF2_HMAC failed");
  }
  return out;
}

}  // namespace

std::vector<std::uint8_t> Pbkdf2HmacSha512(const std::string& password,
                                           std::span<const std::uint8_t> salt,
                                           std::uint32_t iterations,
                                           std::size_t dk_len) {
  return Pbkdf2(EVP_sha512(), password, salt, iterations, dk_len);
}

std::vector<std::uint8_t> Pbkdf2HmacSha256(const std::string& password,
                                           std::span<const std::uint8_t> salt,
                                           std::uint32_t iterations,
                                           std::size_t dk_len) {
  return Pbkdf2(EVP_sha256(), password, salt, iterations, dk_len);
}

}  // namespace kasstamp::util
