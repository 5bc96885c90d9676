#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace kasstamp::crypto {

// HKDF "info" for envelope keys. Bumping the suffix yields an independent key
// space for a future envelope format.
inline constexpr std::string_view kEnvelopeKeyContext = "kasstamp-file-encryption-v1";

// nonce(12) + tag(16) added to every sealed blob.
inline constexpr std::size_t kEnvelopeOverhead = 28;

class EnvelopeKey;

// HKDF-SHA256(ikm = private_key, salt = UTF-8 salt, info = kEnvelopeKeyContext).
// The private key must be 32 bytes and the salt non-empty; each artifact group
// uses its own salt so no two plaintexts share a key. Throws
// StampError(kInvalidArgument) on bad input.
EnvelopeKey DeriveEnvelopeKey(std::span<const std::uint8_t> private_key, std::string_view salt);

// nonce(12, random) || AES-256-GCM ciphertext || tag(16).
std::vector<std::uint8_t> EncryptEnvelope(std::span<const std::uint8_t> plaintext,
                                          const EnvelopeKey& key);

// Throws StampError(kCiphertextTooShort) for blobs that cannot hold a nonce
// and tag, StampError(kAuthenticationFailed) when the tag does not verify.
std::vector<std::uint8_t> DecryptEnvelope(std::span<const std::uint8_t> blob,
                                          const EnvelopeKey& key);

// AES-256-GCM key with no accessor for its bytes. Wiped on destruction;
// moving transfers the key and wipes the source.
class EnvelopeKey {
 public:
  EnvelopeKey(const EnvelopeKey&) = delete;
  EnvelopeKey& operator=(const EnvelopeKey&) = delete;
  EnvelopeKey(EnvelopeKey&& other) noexcept;
  EnvelopeKey& operator=(EnvelopeKey&& other) noexcept;
  ~EnvelopeKey();

 private:
  explicit EnvelopeKey(const std::array<std::uint8_t, 32>& key) : key_(key) {}

  friend EnvelopeKey DeriveEnvelopeKey(std::span<const std::uint8_t>, std::string_view);
  friend std::vector<std::uint8_t> EncryptEnvelope(std::span<const std::uint8_t>,
                                                   const EnvelopeKey&);
  friend std::vector<std::uint8_t> DecryptEnvelope(std::span<const std::uint8_t>,
                                                   const EnvelopeKey&);

  std::array<std::uint8_t, 32> key_{};
};

}  // namespace kasstamp::crypto
