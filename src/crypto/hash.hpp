#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>

namespace kasstamp::crypto {

using Sha256Hash = std::array<std::uint8_t, 32>;
using Sha512Hash = std::array<std::uint8_t, 64>;

Sha256Hash Sha256(std::span<const std::uint8_t> data);

// Lowercase hex digest; the form used for chunk digests and artifact hashes.
std::string Sha256Hex(std::span<const std::uint8_t> data);

Sha256Hash HmacSha256(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data);
Sha512Hash HmacSha512(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data);

}  // namespace kasstamp::crypto
