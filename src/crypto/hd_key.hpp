#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "util/secure_wipe.hpp"

namespace kasstamp::crypto {

inline constexpr std::uint32_t kHardenedBit = 0x80000000u;
inline constexpr std::uint32_t kKaspaCoinType = 111111;

// Which key of an account: m/44'/<coin>'/account'/{0 receive | 1 change}/address.
struct KeyDerivation {
  std::uint32_t account_index{0};
  std::uint32_t address_index{0};
  bool is_receive{true};

  bool operator==(const KeyDerivation& other) const = default;
};

std::vector<std::uint32_t> DerivationPath(std::uint32_t coin_type, const KeyDerivation& derivation);
std::string FormatDerivationPath(std::span<const std::uint32_t> path);

// BIP32 extended private key on secp256k1. Not copyable; the secret half is
// wiped when the object dies.
class ExtendedPrivateKey {
 public:
  // Master key: HMAC-SHA512(key = "Bitcoin seed", seed).
  static ExtendedPrivateKey FromSeed(std::span<const std::uint8_t> seed);

  ExtendedPrivateKey(ExtendedPrivateKey&&) noexcept = default;
  ExtendedPrivateKey& operator=(ExtendedPrivateKey&&) noexcept = default;
  ExtendedPrivateKey(const ExtendedPrivateKey&) = delete;
  ExtendedPrivateKey& operator=(const ExtendedPrivateKey&) = delete;
  ~ExtendedPrivateKey();

  // Indices with kHardenedBit set use hardened derivation. Throws
  // StampError(kCryptoFailure) for the (astronomically rare) invalid child.
  ExtendedPrivateKey DeriveChild(std::uint32_t index) const;
  ExtendedPrivateKey DerivePath(std::span<const std::uint32_t> path) const;

  std::span<const std::uint8_t> secret() const noexcept { return key_.span(); }
  const std::array<std::uint8_t, 32>& chain_code() const noexcept { return chain_code_; }

 private:
  ExtendedPrivateKey(std::span<const std::uint8_t> key, std::span<const std::uint8_t> chain_code);

  util::SecureBytes key_;
  std::array<std::uint8_t, 32> chain_code_{};
};

std::array<std::uint8_t, 33> CompressedPublicKey(std::span<const std::uint8_t> private_key);

// BIP340 style x-only key: the compressed key without its parity byte.
std::array<std::uint8_t, 32> XOnlyPublicKey(std::span<const std::uint8_t> private_key);

}  // namespace kasstamp::crypto
