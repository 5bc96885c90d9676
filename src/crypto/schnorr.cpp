#include "crypto/schnorr.hpp"

#include <algorithm>
#include <string_view>
#include <vector>

#include "crypto/hash.hpp"
#include "crypto/secp256k1.hpp"
#include "util/error.hpp"
#include "util/secure_wipe.hpp"

namespace kasstamp::crypto {

namespace {

using namespace secp256k1;

Sha256Hash TaggedHash(std::string_view tag, std::span<const std::uint8_t> a,
                      std::span<const std::uint8_t> b = {},
                      std::span<const std::uint8_t> c = {}) {
  const auto tag_hash = Sha256(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(tag.data()), tag.size()));
  std::vector<std::uint8_t> buffer;
  buffer.reserve(64 + a.size() + b.size() + c.size());
  buffer.insert(buffer.end(), tag_hash.begin(), tag_hash.end());
  buffer.insert(buffer.end(), tag_hash.begin(), tag_hash.end());
  buffer.insert(buffer.end(), a.begin(), a.end());
  buffer.insert(buffer.end(), b.begin(), b.end());
  buffer.insert(buffer.end(), c.begin(), c.end());
  const auto digest = Sha256(buffer);
  util::SecureWipe(buffer);
  return digest;
}

std::array<std::uint8_t, 32> ToBytes32(const BIGNUM* bn) {
  std::array<std::uint8_t, 32> out{};
  if (BN_bn2binpad(bn, out.data(), static_cast<int>(out.size())) != static_cast<int>(out.size())) {
    ThrowEc("BN_bn2binpad");
  }
  return out;
}

// Affine x coordinate and y parity of a point.
bool PointCoordinates(const EC_POINT* point, BN_CTX* ctx, std::array<std::uint8_t, 32>* x,
                      bool* y_odd) {
  BnPtr bx(BN_new());
  BnPtr by(BN_new());
  if (!bx || !by ||
      EC_POINT_get_affine_coordinates(Group(), point, bx.get(), by.get(), ctx) != 1) {
    return false;
  }
  *x = ToBytes32(bx.get());
  *y_odd = BN_is_odd(by.get()) != 0;
  return true;
}

BnPtr ReduceModOrder(const Sha256Hash& digest, BN_CTX* ctx) {
  auto value = ToBn(digest);
  if (BN_nnmod(value.get(), value.get(), EC_GROUP_get0_order(Group()), ctx) != 1) {
    ThrowEc("BN_nnmod");
  }
  return value;
}

}  // namespace

SchnorrSignature SchnorrSign(std::span<const std::uint8_t> private_key,
                             std::span<const std::uint8_t> message32) {
  if (private_key.size() != 32 || message32.size() != 32) {
    util::Fail(util::ErrorCode::kInvalidArgument, "schnorr signing needs 32-byte key and message");
  }
  const EC_GROUP* group = Group();
  const BIGNUM* order = EC_GROUP_get0_order(group);
  auto ctx = NewContext();

  auto d = ToBn(private_key);
  if (!IsValidScalar(d.get())) {
    util::Fail(util::ErrorCode::kInvalidArgument, "secp256k1 private key out of range");
  }
  PointPtr p(EC_POINT_new(group));
  if (!p || EC_POINT_mul(group, p.get(), d.get(), nullptr, nullptr, ctx.get()) != 1) {
    ThrowEc("EC_POINT_mul");
  }
  std::array<std::uint8_t, 32> px{};
  bool p_odd = false;
  if (!PointCoordinates(p.get(), ctx.get(), &px, &p_odd)) {
    ThrowEc("public key coordinates");
  }
  if (p_odd && BN_sub(d.get(), order, d.get()) != 1) {
    ThrowEc("BN_sub");
  }

  auto d_bytes = ToBytes32(d.get());
  const std::array<std::uint8_t, 32> zero_aux{};
  const auto aux_hash = TaggedHash("BIP0340/aux", zero_aux);
  std::array<std::uint8_t, 32> t{};
  for (std::size_t i = 0; i < t.size(); ++i) {
    t[i] = static_cast<std::uint8_t>(d_bytes[i] ^ aux_hash[i]);
  }
  const auto nonce_hash = TaggedHash("BIP0340/nonce", t, px, message32);
  util::SecureWipe(t);
  util::SecureWipe(d_bytes);

  auto k = ReduceModOrder(nonce_hash, ctx.get());
  if (BN_is_zero(k.get())) {
    ThrowEc("nonce generation");
  }
  PointPtr r(EC_POINT_new(group));
  if (!r || EC_POINT_mul(group, r.get(), k.get(), nullptr, nullptr, ctx.get()) != 1) {
    ThrowEc("EC_POINT_mul");
  }
  std::array<std::uint8_t, 32> rx{};
  bool r_odd = false;
  if (!PointCoordinates(r.get(), ctx.get(), &rx, &r_odd)) {
    ThrowEc("nonce coordinates");
  }
  if (r_odd && BN_sub(k.get(), order, k.get()) != 1) {
    ThrowEc("BN_sub");
  }

  const auto e = ReduceModOrder(TaggedHash("BIP0340/challenge", rx, px, message32), ctx.get());
  BnPtr s(BN_new());
  if (!s || BN_mod_mul(s.get(), e.get(), d.get(), order, ctx.get()) != 1 ||
      BN_mod_add(s.get(), s.get(), k.get(), order, ctx.get()) != 1) {
    ThrowEc("signature scalar");
  }
  SchnorrSignature signature{};
  std::copy(rx.begin(), rx.end(), signature.begin());
  const auto s_bytes = ToBytes32(s.get());
  std::copy(s_bytes.begin(), s_bytes.end(), signature.begin() + 32);
  return signature;
}

bool SchnorrVerify(std::span<const std::uint8_t> x_only_public_key,
                   std::span<const std::uint8_t> message32,
                   std::span<const std::uint8_t> signature) {
  if (x_only_public_key.size() != 32 || message32.size() != 32 || signature.size() != 64) {
    return false;
  }
  const EC_GROUP* group = Group();
  const BIGNUM* order = EC_GROUP_get0_order(group);
  auto ctx = NewContext();

  const auto px = ToBn(x_only_public_key);
  PointPtr p(EC_POINT_new(group));
  if (!p || EC_POINT_set_compressed_coordinates(group, p.get(), px.get(), 0, ctx.get()) != 1) {
    return false;
  }
  const auto r = ToBn(signature.first(32));
  const auto s = ToBn(signature.subspan(32));
  BnPtr field_p(BN_new());
  if (!field_p || EC_GROUP_get_curve(group, field_p.get(), nullptr, nullptr, ctx.get()) != 1) {
    ThrowEc("EC_GROUP_get_curve");
  }
  if (BN_cmp(r.get(), field_p.get()) >= 0 || BN_cmp(s.get(), order) >= 0) {
    return false;
  }
  const auto e = ReduceModOrder(
      TaggedHash("BIP0340/challenge", signature.first(32), x_only_public_key, message32),
      ctx.get());
  // R = s*G - e*P
  BnPtr neg_e(BN_new());
  if (!neg_e || BN_mod_sub(neg_e.get(), order, e.get(), order, ctx.get()) != 1) {
    ThrowEc("BN_mod_sub");
  }
  PointPtr point_r(EC_POINT_new(group));
  if (!point_r ||
      EC_POINT_mul(group, point_r.get(), s.get(), p.get(), neg_e.get(), ctx.get()) != 1) {
    return false;
  }
  if (EC_POINT_is_at_infinity(group, point_r.get())) {
    return false;
  }
  std::array<std::uint8_t, 32> rx{};
  bool r_odd = false;
  if (!PointCoordinates(point_r.get(), ctx.get(), &rx, &r_odd) || r_odd) {
    return false;
  }
  return std::equal(rx.begin(), rx.end(), signature.begin());
}

}  // namespace kasstamp::crypto
