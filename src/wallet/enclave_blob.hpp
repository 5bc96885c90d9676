#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "util/argon2_kdf.hpp"
#include "util/secure_wipe.hpp"

namespace kasstamp::wallet {

// Version 1: PBKDF2-SHA256 wrapping key, plaintext is the bare mnemonic.
// Version 2: Argon2id wrapping key; the salt field carries the 16-byte salt
// followed by t, m and p as little-endian u32; plaintext is
// u16-le mnemonic length || mnemonic || passphrase.
inline constexpr std::uint8_t kEnclaveBlobLegacyVersion = 1;
inline constexpr std::uint8_t kEnclaveBlobVersion = 2;
inline constexpr std::size_t kEnclaveSaltSize = 16;
inline constexpr std::size_t kEnclaveArgonSaltFieldSize = kEnclaveSaltSize + 12;
inline constexpr std::uint32_t kLegacyPbkdf2Iterations = 100000;

// Persisted layout:
// [u8 version][u16-le salt length][salt][u32-le cipher length][cipher]
// where cipher is nonce(12) || ciphertext || tag(16).
struct EnclaveBlob {
  std::uint8_t version{kEnclaveBlobVersion};
  std::vector<std::uint8_t> salt;
  std::vector<std::uint8_t> cipher;
};

struct MnemonicSecret {
  std::string mnemonic;
  std::string passphrase;

  MnemonicSecret() = default;
  MnemonicSecret(const MnemonicSecret&) = delete;
  MnemonicSecret& operator=(const MnemonicSecret&) = delete;
  MnemonicSecret(MnemonicSecret&&) noexcept = default;
  MnemonicSecret& operator=(MnemonicSecret&&) noexcept = default;
  ~MnemonicSecret() {
    util::SecureWipe(mnemonic);
    util::SecureWipe(passphrase);
  }
};

std::vector<std::uint8_t> SerializeEnclaveBlob(const EnclaveBlob& blob);
bool ParseEnclaveBlob(std::span<const std::uint8_t> bytes, EnclaveBlob* blob,
                      std::string* error = nullptr);

// Encrypts mnemonic and passphrase into a version 2 blob under a fresh salt
// and nonce.
EnclaveBlob SealMnemonic(const std::string& mnemonic, const std::string& passphrase,
                         const std::string& password, const util::Argon2idParams& params);

// Derives the key that unwraps the blob. Throws StampError(kCryptoFailure)
// when the KDF fails and kInvalidArgument for unusable blob parameters.
util::SecureBytes DeriveWrappingKey(const EnclaveBlob& blob, const std::string& password);

// Returns std::nullopt when authentication fails (wrong key or tampered
// blob). Malformed plaintext layouts throw.
std::optional<MnemonicSecret> OpenEnclaveBlob(const EnclaveBlob& blob,
                                              const util::SecureBytes& wrapping_key);

}  // namespace kasstamp::wallet
