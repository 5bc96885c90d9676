#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace kasstamp::util {

// PBKDF2 (RFC 8018) over OpenSSL. Both helpers return `dk_len` bytes and
// throw StampError(kCryptoFailure) if the provider rejects the request.

// BIP39 seed stretching uses the SHA-512 variant.
std::vector<std::uint8_t> Pbkdf2HmacSha512(const std::string& password,
                                           std::span<const std::uint8_t> salt,
                                           std::uint32_t iterations,
                                           std::size_t dk_len);

// Legacy (version 1) enclave blobs were wrapped with the SHA-256 variant.
std::vector<std::uint8_t> Pbkdf2HmacSha256(const std::string& password,
                                           std::span<const std::uint8_t> salt,
                                           std::uint32_t iterations,
                                           std::size_t dk_len);

}  // namespace kasstamp::util
