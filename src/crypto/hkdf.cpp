#include "crypto/hkdf.hpp"

#include <vector>

#include "crypto/hash.hpp"
#include "util/secure_wipe.hpp"

namespace kasstamp::crypto {

std::array<std::uint8_t, 32> HkdfSha256(std::span<const std::uint8_t> ikm,
                                        std::span<const std::uint8_t> salt,
                                        std::span<const std::uint8_t> info) {
  // Extract. An empty salt and a salt of HashLen zero bytes key HMAC the same way.
  auto prk = HmacSha256(salt, ikm);

  // Expand: 32 bytes is a single block, T(1) = HMAC(PRK, info || 0x01).
  std::vector<std::uint8_t> block(info.begin(), info.end());
  block.push_back(0x01);
  const auto okm = HmacSha256(prk, block);
  util::SecureWipe(prk);
  return okm;
}

}  // namespace kasstamp::crypto
