#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kasstamp::crypto {

// Address payload version byte.
enum class AddressVersion : std::uint8_t {
  kPubKey = 0,       // 32-byte x-only Schnorr key
  kPubKeyEcdsa = 1,  // 33-byte compressed key
  kScriptHash = 8,   // 32-byte script hash
};

struct DecodedAddress {
  std::string prefix;
  AddressVersion version{AddressVersion::kPubKey};
  std::vector<std::uint8_t> payload;
};

// "<prefix>:<base32 payload><8 char checksum>" using the cashaddr polymod with
// the prefix folded into the checksum.
std::string EncodeAddress(std::string_view prefix, AddressVersion version,
                          std::span<const std::uint8_t> payload);

std::string AddressFromXOnlyKey(std::string_view prefix, const std::array<std::uint8_t, 32>& key);

// Strict: lowercase only, known version with matching payload length, valid
// checksum.
std::optional<DecodedAddress> DecodeAddress(std::string_view address);

// Standard locking script for an address: <push key> OP_CHECKSIG for key
// addresses, OP_BLAKE2B <hash> OP_EQUAL for script hashes.
std::vector<std::uint8_t> PayToAddressScript(const DecodedAddress& address);

}  // namespace kasstamp::crypto
