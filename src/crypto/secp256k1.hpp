#pragma once

#include <cstdint>
#include <memory>
#include <span>

#include <openssl/bn.h>
#include <openssl/ec.h>

// OpenSSL handles shared by the secp256k1 users in this directory.
namespace kasstamp::crypto::secp256k1 {

struct BnDeleter {
  void operator()(BIGNUM* bn) const noexcept { BN_clear_free(bn); }
};
struct BnCtxDeleter {
  void operator()(BN_CTX* ctx) const noexcept { BN_CTX_free(ctx); }
};
struct GroupDeleter {
  void operator()(EC_GROUP* group) const noexcept { EC_GROUP_free(group); }
};
struct PointDeleter {
  void operator()(EC_POINT* point) const noexcept { EC_POINT_free(point); }
};
using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;

[[noreturn]] void ThrowEc(const char* step);

const EC_GROUP* Group();
BnPtr ToBn(std::span<const std::uint8_t> bytes);
BnCtxPtr NewContext();
// Valid secret scalar: 0 < k < n.
bool IsValidScalar(const BIGNUM* k);

}  // namespace kasstamp::crypto::secp256k1
