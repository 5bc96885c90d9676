#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "chain/transaction_service.hpp"
#include "config/network.hpp"
#include "crypto/envelope_crypto.hpp"
#include "crypto/hd_key.hpp"
#include "util/argon2_kdf.hpp"
#include "util/secure_wipe.hpp"
#include "wallet/enclave_blob.hpp"
#include "wallet/key_value_storage.hpp"

namespace kasstamp::wallet {

inline constexpr std::chrono::milliseconds kDefaultAutoLock = std::chrono::minutes(30);
inline constexpr std::size_t kMinPasswordLength = 8;
// Addresses probed per chain (receive, then change) by SignWithAutoDiscovery.
inline constexpr std::uint32_t kAutoDiscoveryWindow = 10;

struct EnclaveOptions {
  std::string wallet_id{"default"};
  util::Argon2idParams kdf_params{util::DefaultArgon2idParams()};
  std::uint32_t coin_type{crypto::kKaspaCoinType};
};

struct EnclaveStatus {
  bool is_locked{true};
  bool has_mnemonic{false};
  std::chrono::milliseconds auto_lock{0};
  std::chrono::milliseconds time_until_lock{0};
};

// Custodian of the wallet mnemonic. The mnemonic is stored encrypted and is
// only decrypted for the duration of a single operation while the enclave is
// unlocked; derived keys never leave a call except inside the transaction
// they sign. One operation may run at a time; concurrent callers get
// StampError(kBusy).
class SigningEnclave {
 public:
  explicit SigningEnclave(KeyValueStorage& storage, EnclaveOptions options = {});
  ~SigningEnclave();

  SigningEnclave(const SigningEnclave&) = delete;
  SigningEnclave& operator=(const SigningEnclave&) = delete;

  void StoreMnemonic(const std::string& mnemonic, const std::string& password,
                     const std::string& passphrase = {});
  void Unlock(const std::string& password,
              std::chrono::milliseconds auto_lock = kDefaultAutoLock);
  void Lock();
  // Locks and removes the stored blob.
  void Clear();
  // Locks the enclave when its deadline has passed.
  void Tick();

  EnclaveStatus GetStatus();
  bool IsLocked();
  bool HasMnemonic();
  const std::string& wallet_id() const noexcept { return options_.wallet_id; }

  void Sign(chain::PendingTransaction& transaction,
            const crypto::KeyDerivation& derivation = {});
  void SignMultiple(chain::PendingTransaction& transaction,
                    std::span<const crypto::KeyDerivation> derivations);
  void SignWithAutoDiscovery(chain::PendingTransaction& transaction,
                             const config::NetworkConfig& network,
                             std::uint32_t account_index = 0);

  std::vector<std::uint8_t> EncryptWithWalletKey(std::span<const std::uint8_t> data,
                                                 const std::string& group_id,
                                                 std::uint32_t account_index = 0);
  std::vector<std::uint8_t> DecryptWithWalletKey(std::span<const std::uint8_t> data,
                                                 const std::string& group_id,
                                                 std::uint32_t account_index = 0);

  std::string DeriveAddress(const config::NetworkConfig& network,
                            const crypto::KeyDerivation& derivation);

 private:
  std::string StorageKey() const;
  std::optional<EnclaveBlob> LoadBlob();
  // Both expect state_mutex_ to be held.
  void LockLocked(const char* reason);
  void RequireUnlockedLocked();
  crypto::ExtendedPrivateKey OpenRootKeyLocked();
  const crypto::EnvelopeKey& EnvelopeKeyLocked(const std::string& group_id,
                                               std::uint32_t account_index);
  chain::SigningKey DeriveSigningKey(const crypto::ExtendedPrivateKey& root,
                                     const crypto::KeyDerivation& derivation) const;

  KeyValueStorage& storage_;
  EnclaveOptions options_;

  std::mutex operation_mutex_;
  std::mutex state_mutex_;
  std::optional<EnclaveBlob> blob_;
  util::SecureBytes wrapping_key_;
  bool unlocked_{false};
  std::chrono::milliseconds auto_lock_{0};
  std::chrono::steady_clock::time_point deadline_{};
  std::map<std::string, crypto::EnvelopeKey> envelope_keys_;
};

}  // namespace kasstamp::wallet
