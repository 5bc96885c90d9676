#include "util/aead.hpp"

#include <algorithm>
#include <limits>
#include <memory>
#include <string>

#include <openssl/err.h>
#include <openssl/evp.h>

#include "util/error.hpp"
#include "util/secure_wipe.hpp"

namespace kasstamp::util {

namespace {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

[[noreturn]] void ThrowOpenSSL(const char* step) {
  const unsigned long code = ERR_get_error();
  std::string message = std::string("AES-256-GCM ") + step + " failed";
  if (code != 0) {
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    message += ": ";
    message += buf;
  }
  Fail(ErrorCode::kCryptoFailure, message);
}

void CheckSizes(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce,
                std::size_t data_size) {
  if (key.size() != kAes256GcmKeySize) {
    Fail(ErrorCode::kCryptoFailure, "AES-256-GCM key must be 32 bytes");
  }
  if (nonce.size() != kAes256GcmNonceSize) {
    Fail(ErrorCode::kCryptoFailure, "AES-256-GCM nonce must be 12 bytes");
  }
  if (data_size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    Fail(ErrorCode::kCryptoFailure, "AES-256-GCM input too large");
  }
}

}  // namespace

std::vector<std::uint8_t> Aes256GcmEncrypt(std::span<const std::uint8_t> key,
                                           std::span<const std::uint8_t> nonce,
                                           std::span<const std::uint8_t> aad,
                                           std::span<const std::uint8_t> plaintext) {
  CheckSizes(key, nonce, plaintext.size());
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowOpenSSL("context allocation");
  }
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
    ThrowOpenSSL("EncryptInit");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(kAes256GcmNonceSize), nullptr) != 1) {
    ThrowOpenSSL("SET_IVLEN");
  }
  if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    ThrowOpenSSL("EncryptInit key/iv");
  }
  int len = 0;
  if (!aad.empty() &&
      EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
    ThrowOpenSSL("EncryptUpdate aad");
  }
  std::vector<std::uint8_t> out(plaintext.size() + kAes256GcmTagSize);
  int total = 0;
  if (!plaintext.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), out.data(), &len, plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1) {
      ThrowOpenSSL("EncryptUpdate");
    }
    total = len;
  }
  if (EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) {
    ThrowOpenSSL("EncryptFinal");
  }
  total += len;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kAes256GcmTagSize),
                          out.data() + total) != 1) {
    ThrowOpenSSL("GET_TAG");
  }
  out.resize(static_cast<std::size_t>(total) + kAes256GcmTagSize);
  return out;
}

bool Aes256GcmDecrypt(std::span<const std::uint8_t> key,
                      std::span<const std::uint8_t> nonce,
                      std::span<const std::uint8_t> aad,
                      std::span<const std::uint8_t> ciphertext,
                      std::vector<std::uint8_t>* plaintext) {
  plaintext->clear();
  CheckSizes(key, nonce, ciphertext.size());
  if (ciphertext.size() < kAes256GcmTagSize) {
    return false;
  }
  const std::size_t body_size = ciphertext.size() - kAes256GcmTagSize;
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowOpenSSL("context allocation");
  }
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
    ThrowOpenSSL("DecryptInit");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(kAes256GcmNonceSize), nullptr) != 1) {
    ThrowOpenSSL("SET_IVLEN");
  }
  if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    ThrowOpenSSL("DecryptInit key/iv");
  }
  int len = 0;
  if (!aad.empty() &&
      EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
    ThrowOpenSSL("DecryptUpdate aad");
  }
  std::vector<std::uint8_t> out(body_size + kAes256GcmTagSize);
  int total = 0;
  if (body_size > 0) {
    if (EVP_DecryptUpdate(ctx.get(), out.data(), &len, ciphertext.data(),
                          static_cast<int>(body_size)) != 1) {
      ThrowOpenSSL("DecryptUpdate");
    }
    total = len;
  }
  std::uint8_t tag[kAes256GcmTagSize];
  std::copy(ciphertext.begin() + static_cast<std::ptrdiff_t>(body_size), ciphertext.end(), tag);
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kAes256GcmTagSize),
                          tag) != 1) {
    ThrowOpenSSL("SET_TAG");
  }
  if (EVP_DecryptFinal_ex(ctx.get(), out.data() + total, &len) <= 0) {
    SecureWipe(out);
    ERR_clear_error();
    return false;
  }
  total += len;
  out.resize(static_cast<std::size_t>(total));
  *plaintext = std::move(out);
  return true;
}

}  // namespace kasstamp::util
