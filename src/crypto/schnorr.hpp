#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace kasstamp::crypto {

using SchnorrSignature = std::array<std::uint8_t, 64>;

// BIP340 Schnorr over secp256k1 with x-only public keys. Signing uses the
// all-zero auxiliary randomness, so signatures are deterministic.
SchnorrSignature SchnorrSign(std::span<const std::uint8_t> private_key,
                             std::span<const std::uint8_t> message32);

bool SchnorrVerify(std::span<const std::uint8_t> x_only_public_key,
                   std::span<const std::uint8_t> message32,
                   std::span<const std::uint8_t> signature);

}  // namespace kasstamp::crypto
