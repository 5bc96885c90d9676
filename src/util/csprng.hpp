#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace kasstamp::util {

// Fills `out` with cryptographically secure random bytes.
bool FillSecureRandomBytes(std::span<std::uint8_t> out, std::string* error = nullptr);

// Returns `size` secure random bytes. Throws StampError(kCryptoFailure) when
// the system source is unavailable; callers never receive predictable bytes.
std::vector<std::uint8_t> SecureRandomBytes(std::size_t size);

// RFC 4122 version 4 identifier, lowercase with dashes. Used as the default
// chunk group id.
std::string RandomUuidV4();

}  // namespace kasstamp::util
