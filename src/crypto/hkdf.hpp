#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace kasstamp::crypto {

// RFC 5869 HKDF-SHA256 (extract + expand) producing 32 bytes.
std::array<std::uint8_t, 32> HkdfSha256(std::span<const std::uint8_t> ikm,
                                        std::span<const std::uint8_t> salt,
                                        std::span<const std::uint8_t> info);

}  // namespace kasstamp::crypto
