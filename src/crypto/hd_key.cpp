#include "crypto/hd_key.hpp"

#include <algorithm>
#include <memory>

#include "crypto/hash.hpp"
#include "crypto/secp256k1.hpp"
#include "util/error.hpp"

namespace kasstamp::crypto {

namespace {

constexpr std::uint32_t kPurpose = 44;

using namespace secp256k1;

}  // namespace

std::vector<std::uint32_t> DerivationPath(std::uint32_t coin_type,
                                          const KeyDerivation& derivation) {
  if ((derivation.account_index & kHardenedBit) != 0 ||
      (derivation.address_index & kHardenedBit) != 0) {
    util::Fail(util::ErrorCode::kInvalidArgument, "derivation index out of range");
  }
  return {kPurpose | kHardenedBit, coin_type | kHardenedBit,
          derivation.account_index | kHardenedBit, derivation.is_receive ? 0u : 1u,
          derivation.address_index};
}

std::string FormatDerivationPath(std::span<const std::uint32_t> path) {
  std::string out = "m";
  for (const auto index : path) {
    out += "/" + std::to_string(index & ~kHardenedBit);
    if ((index & kHardenedBit) != 0) {
      out += "'";
    }
  }
  return out;
}

ExtendedPrivateKey::ExtendedPrivateKey(std::span<const std::uint8_t> key,
                                       std::span<const std::uint8_t> chain_code)
    : key_(key) {
  std::copy_n(chain_code.begin(), chain_code_.size(), chain_code_.begin());
}

ExtendedPrivateKey::~ExtendedPrivateKey() { util::SecureWipe(chain_code_); }

ExtendedPrivateKey ExtendedPrivateKey::FromSeed(std::span<const std::uint8_t> seed) {
  if (seed.size() < 16 || seed.size() > 64) {
    util::Fail(util::ErrorCode::kInvalidArgument, "HD seed must be 16..64 bytes");
  }
  static constexpr std::string_view kSeedKey = "Bitcoin seed";
  auto digest = HmacSha512(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(kSeedKey.data()),
                                    kSeedKey.size()),
      seed);
  const auto il = ToBn(std::span<const std::uint8_t>(digest.data(), 32));
  if (!IsValidScalar(il.get())) {
    util::SecureWipe(digest);
    util::Fail(util::ErrorCode::kCryptoFailure, "seed produced an invalid master key");
  }
  ExtendedPrivateKey master(std::span<const std::uint8_t>(digest.data(), 32),
                            std::span<const std::uint8_t>(digest.data() + 32, 32));
  util::SecureWipe(digest);
  return master;
}

ExtendedPrivateKey ExtendedPrivateKey::DeriveChild(std::uint32_t index) const {
  std::array<std::uint8_t, 37> data{};
  if ((index & kHardenedBit) != 0) {
    data[0] = 0x00;
    std::copy(key_.span().begin(), key_.span().end(), data.begin() + 1);
  } else {
    const auto pub = CompressedPublicKey(key_.span());
    std::copy(pub.begin(), pub.end(), data.begin());
  }
  data[33] = static_cast<std::uint8_t>((index >> 24) & 0xFF);
  data[34] = static_cast<std::uint8_t>((index >> 16) & 0xFF);
  data[35] = static_cast<std::uint8_t>((index >> 8) & 0xFF);
  data[36] = static_cast<std::uint8_t>(index & 0xFF);

  auto digest = HmacSha512(chain_code_, data);
  util::SecureWipe(data);

  BnCtxPtr ctx(BN_CTX_new());
  if (!ctx) {
    util::SecureWipe(digest);
    ThrowEc("BN_CTX_new");
  }
  const auto il = ToBn(std::span<const std::uint8_t>(digest.data(), 32));
  const auto parent = ToBn(key_.span());
  BnPtr child(BN_new());
  const BIGNUM* order = EC_GROUP_get0_order(Group());
  if (!child || BN_cmp(il.get(), order) >= 0 ||
      BN_mod_add(child.get(), il.get(), parent.get(), order, ctx.get()) != 1 ||
      BN_is_zero(child.get())) {
    util::SecureWipe(digest);
    util::Fail(util::ErrorCode::kCryptoFailure,
               "invalid child key at index " + std::to_string(index));
  }
  std::array<std::uint8_t, 32> child_key{};
  if (BN_bn2binpad(child.get(), child_key.data(), static_cast<int>(child_key.size())) !=
      static_cast<int>(child_key.size())) {
    util::SecureWipe(digest);
    ThrowEc("BN_bn2binpad");
  }
  ExtendedPrivateKey out(child_key, std::span<const std::uint8_t>(digest.data() + 32, 32));
  util::SecureWipe(child_key);
  util::SecureWipe(digest);
  return out;
}

ExtendedPrivateKey ExtendedPrivateKey::DerivePath(std::span<const std::uint32_t> path) const {
  ExtendedPrivateKey current(key_.span(), chain_code_);
  for (const auto index : path) {
    current = current.DeriveChild(index);
  }
  return current;
}

std::array<std::uint8_t, 33> CompressedPublicKey(std::span<const std::uint8_t> private_key) {
  if (private_key.size() != 32) {
    util::Fail(util::ErrorCode::kInvalidArgument, "secp256k1 private key must be 32 bytes");
  }
  const EC_GROUP* group = Group();
  BnCtxPtr ctx(BN_CTX_new());
  if (!ctx) {
    ThrowEc("BN_CTX_new");
  }
  const auto scalar = ToBn(private_key);
  if (!IsValidScalar(scalar.get())) {
    util::Fail(util::ErrorCode::kInvalidArgument, "secp256k1 private key out of range");
  }
  PointPtr point(EC_POINT_new(group));
  if (!point || EC_POINT_mul(group, point.get(), scalar.get(), nullptr, nullptr, ctx.get()) != 1) {
    ThrowEc("EC_POINT_mul");
  }
  std::array<std::uint8_t, 33> out{};
  if (EC_POINT_point2oct(group, point.get(), POINT_CONVERSION_COMPRESSED, out.data(), out.size(),
                         ctx.get()) != out.size()) {
    ThrowEc("EC_POINT_point2oct");
  }
  return out;
}

std::array<std::uint8_t, 32> XOnlyPublicKey(std::span<const std::uint8_t> private_key) {
  const auto compressed = CompressedPublicKey(private_key);
  std::array<std::uint8_t, 32> out{};
  std::copy(compressed.begin() + 1, compressed.end(), out.begin());
  return out;
}

}  // namespace kasstamp::crypto
