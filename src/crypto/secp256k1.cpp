#include "crypto/secp256k1.hpp"

#include <string>

#include <openssl/obj_mac.h>

#include "util/error.hpp"

namespace kasstamp::crypto::secp256k1 {

void ThrowEc(const char* step) {
  util::Fail(util::ErrorCode::kCryptoFailure, std::string("secp256k1 ") + step + " failed");
}

const EC_GROUP* Group() {
  static const GroupPtr group = [] {
    GroupPtr g(EC_GROUP_new_by_curve_name(NID_secp256k1));
    if (!g) {
      ThrowEc("curve setup");
    }
    return g;
  }();
  return group.get();
}

BnPtr ToBn(std::span<const std::uint8_t> bytes) {
  BnPtr bn(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));
  if (!bn) {
    ThrowEc("BN_bin2bn");
  }
  return bn;
}

BnCtxPtr NewContext() {
  BnCtxPtr ctx(BN_CTX_new());
  if (!ctx) {
    ThrowEc("BN_CTX_new");
  }
  return ctx;
}

bool IsValidScalar(const BIGNUM* k) {
  return !BN_is_zero(k) && BN_cmp(k, EC_GROUP_get0_order(Group())) < 0;
}

}  // namespace kasstamp::crypto::secp256k1
