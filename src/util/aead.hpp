#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace kasstamp::util {

constexpr std::size_t kAes256GcmKeySize = 32;
constexpr std::size_t kAes256GcmNonceSize = 12;
constexpr std::size_t kAes256GcmTagSize = 16;

// Returns ciphertext || tag. Throws StampError(kCryptoFailure) on provider
// errors or wrong key/nonce sizes.
std::vector<std::uint8_t> Aes256GcmEncrypt(std::span<const std::uint8_t> key,
                                           std::span<const std::uint8_t> nonce,
                                           std::span<const std::uint8_t> aad,
                                           std::span<const std::uint8_t> plaintext);

// `ciphertext` is ciphertext || tag. Returns false when authentication fails;
// `plaintext` is left empty in that case.
bool Aes256GcmDecrypt(std::span<const std::uint8_t> key,
                      std::span<const std::uint8_t> nonce,
                      std::span<const std::uint8_t> aad,
                      std::span<const std::uint8_t> ciphertext,
                      std::vector<std::uint8_t>* plaintext);

}  // namespace kasstamp::util
