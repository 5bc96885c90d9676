#include "wallet/signing_enclave.hpp"

#include <algorithm>
#include <set>

#include "crypto/address.hpp"
#include "crypto/mnemonic.hpp"
#include "util/error.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"

namespace kasstamp::wallet {

namespace {

using Clock = std::chrono::steady_clock;

class OperationGuard {
 public:
  explicit OperationGuard(std::mutex& mutex) : lock_(mutex, std::try_to_lock) {
    if (!lock_.owns_lock()) {
      util::Fail(util::ErrorCode::kBusy, "signing enclave is busy with another operation");
    }
  }

 private:
  std::unique_lock<std::mutex> lock_;
};

std::string JoinAddresses(const std::vector<std::string>& addresses) {
  std::string out;
  for (const auto& address : addresses) {
    if (!out.empty()) {
      out += ", ";
    }
    out += address;
  }
  return out;
}

}  // namespace

SigningEnclave::SigningEnclave(KeyValueStorage& storage, EnclaveOptions options)
    : storage_(storage), options_(std::move(options)) {}

SigningEnclave::~SigningEnclave() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  unlocked_ = false;
  wrapping_key_.clear();
  envelope_keys_.clear();
}

std::string SigningEnclave::StorageKey() const { return options_.wallet_id + ".enclave"; }

std::optional<EnclaveBlob> SigningEnclave::LoadBlob() {
  if (blob_) {
    return blob_;
  }
  const auto stored = storage_.GetItem(StorageKey());
  if (!stored) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> bytes;
  if (!util::HexDecode(util::StripHexDecorations(*stored), &bytes)) {
    util::Fail(util::ErrorCode::kInvalidHex, "stored enclave blob is not valid hex");
  }
  EnclaveBlob blob;
  std::string error;
  if (!ParseEnclaveBlob(bytes, &blob, &error)) {
    util::Fail(util::ErrorCode::kStorageFailure, "stored enclave blob is invalid: " + error);
  }
  blob_ = std::move(blob);
  return blob_;
}

void SigningEnclave::StoreMnemonic(const std::string& mnemonic, const std::string& password,
                                   const std::string& passphrase) {
  OperationGuard guard(operation_mutex_);
  std::string normalized;
  std::string error;
  if (!crypto::NormalizeMnemonic(mnemonic, &normalized, &error)) {
    util::SecureWipe(normalized);
    util::Fail(util::ErrorCode::kInvalidArgument, "invalid mnemonic: " + error);
  }
  if (password.size() < kMinPasswordLength) {
    util::SecureWipe(normalized);
    util::Fail(util::ErrorCode::kInvalidArgument,
               "password must be at least " + std::to_string(kMinPasswordLength) + " characters");
  }
  EnclaveBlob blob;
  try {
    blob = SealMnemonic(normalized, passphrase, password, options_.kdf_params);
  } catch (...) {
    util::SecureWipe(normalized);
    throw;
  }
  util::SecureWipe(normalized);
  storage_.SetItem(StorageKey(), util::HexEncode(SerializeEnclaveBlob(blob)));

  std::lock_guard<std::mutex> lock(state_mutex_);
  LockLocked("new mnemonic stored");
  blob_ = std::move(blob);
  util::LogInfo("enclave[" + options_.wallet_id + "]: mnemonic stored");
}

void SigningEnclave::Unlock(const std::string& password, std::chrono::milliseconds auto_lock) {
  OperationGuard guard(operation_mutex_);
  std::lock_guard<std::mutex> lock(state_mutex_);
  const auto blob = LoadBlob();
  if (!blob) {
    util::Fail(util::ErrorCode::kNoMnemonic, "no mnemonic stored; call StoreMnemonic first");
  }
  const bool session_live =
      unlocked_ && (auto_lock_.count() <= 0 || Clock::now() < deadline_);
  auto key = DeriveWrappingKey(*blob, password);
  if (!OpenEnclaveBlob(*blob, key)) {
    if (session_live) {
      // A failed re-unlock leaves the running session and its expiry alone.
      util::LogWarn("enclave[" + options_.wallet_id + "]: re-unlock rejected");
      util::Fail(util::ErrorCode::kWrongPassword, "invalid password or corrupted enclave data");
    }
    LockLocked("unlock failed");
    util::LogWarn("enclave[" + options_.wallet_id + "]: unlock rejected");
    util::Fail(util::ErrorCode::kWrongPassword, "invalid password or corrupted enclave data");
  }
  wrapping_key_ = std::move(key);
  unlocked_ = true;
  auto_lock_ = auto_lock;
  deadline_ = Clock::now() + auto_lock;
  if (session_live) {
    util::LogDebug("enclave[" + options_.wallet_id + "]: already unlocked, expiry refreshed");
  } else if (auto_lock.count() > 0) {
    util::LogInfo("enclave[" + options_.wallet_id + "]: unlocked, auto-lock in " +
                  std::to_string(auto_lock.count() / 1000) + "s");
  } else {
    util::LogInfo("enclave[" + options_.wallet_id + "]: unlocked without auto-lock");
  }
}

void SigningEnclave::LockLocked(const char* reason) {
  const bool was_unlocked = unlocked_;
  unlocked_ = false;
  wrapping_key_.clear();
  envelope_keys_.clear();
  auto_lock_ = std::chrono::milliseconds(0);
  deadline_ = {};
  if (was_unlocked) {
    util::LogInfo("enclave[" + options_.wallet_id + "]: locked (" + reason + ")");
  }
}

void SigningEnclave::Lock() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  LockLocked("requested");
}

void SigningEnclave::Clear() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  LockLocked("cleared");
  blob_.reset();
  storage_.RemoveItem(StorageKey());
  util::LogInfo("enclave[" + options_.wallet_id + "]: stored mnemonic removed");
}

void SigningEnclave::Tick() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (unlocked_ && auto_lock_.count() > 0 && Clock::now() >= deadline_) {
    LockLocked("auto-lock");
  }
}

void SigningEnclave::RequireUnlockedLocked() {
  if (unlocked_ && auto_lock_.count() > 0 && Clock::now() >= deadline_) {
    LockLocked("auto-lock");
  }
  if (!unlocked_) {
    util::Fail(util::ErrorCode::kLocked, "signing enclave is locked; unlock it first");
  }
}

EnclaveStatus SigningEnclave::GetStatus() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (unlocked_ && auto_lock_.count() > 0 && Clock::now() >= deadline_) {
    LockLocked("auto-lock");
  }
  EnclaveStatus status;
  status.is_locked = !unlocked_;
  status.has_mnemonic = LoadBlob().has_value();
  status.auto_lock = auto_lock_;
  if (unlocked_ && auto_lock_.count() > 0) {
    status.time_until_lock =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now());
  }
  return status;
}

bool SigningEnclave::IsLocked() { return GetStatus().is_locked; }

bool SigningEnclave::HasMnemonic() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return LoadBlob().has_value();
}

crypto::ExtendedPrivateKey SigningEnclave::OpenRootKeyLocked() {
  const auto blob = LoadBlob();
  if (!blob) {
    LockLocked("mnemonic missing");
    util::Fail(util::ErrorCode::kNoMnemonic, "no mnemonic stored");
  }
  auto secret = OpenEnclaveBlob(*blob, wrapping_key_);
  if (!secret) {
    LockLocked("stored blob no longer opens");
    util::Fail(util::ErrorCode::kAuthenticationFailed, "stored enclave blob failed authentication");
  }
  auto seed = crypto::MnemonicSeedFromSentence(secret->mnemonic, secret->passphrase);
  auto root = crypto::ExtendedPrivateKey::FromSeed(seed);
  util::SecureWipe(seed);
  return root;
}

chain::SigningKey SigningEnclave::DeriveSigningKey(const crypto::ExtendedPrivateKey& root,
                                                   const crypto::KeyDerivation& derivation) const {
  const auto path = crypto::DerivationPath(options_.coin_type, derivation);
  const auto child = root.DerivePath(path);
  return chain::SigningKey(util::SecureBytes(child.secret()), crypto::XOnlyPublicKey(child.secret()));
}

void SigningEnclave::Sign(chain::PendingTransaction& transaction,
                          const crypto::KeyDerivation& derivation) {
  SignMultiple(transaction, std::span<const crypto::KeyDerivation>(&derivation, 1));
}

void SigningEnclave::SignMultiple(chain::PendingTransaction& transaction,
                                  std::span<const crypto::KeyDerivation> derivations) {
  OperationGuard guard(operation_mutex_);
  if (derivations.empty()) {
    util::Fail(util::ErrorCode::kInvalidArgument, "at least one key derivation is required");
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  RequireUnlockedLocked();
  std::vector<chain::SigningKey> keys;
  keys.reserve(derivations.size());
  {
    const auto root = OpenRootKeyLocked();
    for (const auto& derivation : derivations) {
      keys.push_back(DeriveSigningKey(root, derivation));
    }
  }
  transaction.Sign(keys);
  util::LogDebug("enclave[" + options_.wallet_id + "]: signed " + transaction.Id() + " with " +
                 std::to_string(keys.size()) + " key(s)");
}

void SigningEnclave::SignWithAutoDiscovery(chain::PendingTransaction& transaction,
                                           const config::NetworkConfig& network,
                                           std::uint32_t account_index) {
  OperationGuard guard(operation_mutex_);
  std::lock_guard<std::mutex> lock(state_mutex_);
  RequireUnlockedLocked();

  const auto wanted = transaction.Addresses();
  std::set<std::string> unmatched(wanted.begin(), wanted.end());
  std::vector<chain::SigningKey> keys;
  {
    const auto root = OpenRootKeyLocked();
    for (bool receive : {true, false}) {
      for (std::uint32_t index = 0; index < kAutoDiscoveryWindow && !unmatched.empty(); ++index) {
        auto key = DeriveSigningKey(root, {account_index, index, receive});
        const auto address = crypto::AddressFromXOnlyKey(network.address_prefix,
                                                         key.x_only_public_key());
        if (unmatched.erase(address) > 0) {
          keys.push_back(std::move(key));
        }
      }
    }
  }
  if (!unmatched.empty()) {
    util::Fail(util::ErrorCode::kKeyNotFound,
               "no key found for address(es): " +
                   JoinAddresses(std::vector<std::string>(unmatched.begin(), unmatched.end())));
  }
  transaction.Sign(keys);
  util::LogDebug("enclave[" + options_.wallet_id + "]: signed " + transaction.Id() +
                 " with " + std::to_string(keys.size()) + " discovered key(s)");
}

const crypto::EnvelopeKey& SigningEnclave::EnvelopeKeyLocked(const std::string& group_id,
                                                            std::uint32_t account_index) {
  const std::string cache_key = group_id + ":" + std::to_string(account_index);
  const auto it = envelope_keys_.find(cache_key);
  if (it != envelope_keys_.end()) {
    return it->second;
  }
  const auto root = OpenRootKeyLocked();
  const auto signing_key = DeriveSigningKey(root, {account_index, 0, true});
  auto key = crypto::DeriveEnvelopeKey(signing_key.secret(), group_id);
  return envelope_keys_.emplace(cache_key, std::move(key)).first->second;
}

std::vector<std::uint8_t> SigningEnclave::EncryptWithWalletKey(std::span<const std::uint8_t> data,
                                                               const std::string& group_id,
                                                               std::uint32_t account_index) {
  OperationGuard guard(operation_mutex_);
  std::lock_guard<std::mutex> lock(state_mutex_);
  RequireUnlockedLocked();
  return crypto::EncryptEnvelope(data, EnvelopeKeyLocked(group_id, account_index));
}

std::vector<std::uint8_t> SigningEnclave::DecryptWithWalletKey(std::span<const std::uint8_t> data,
                                                               const std::string& group_id,
                                                               std::uint32_t account_index) {
  OperationGuard guard(operation_mutex_);
  std::lock_guard<std::mutex> lock(state_mutex_);
  RequireUnlockedLocked();
  return crypto::DecryptEnvelope(data, EnvelopeKeyLocked(group_id, account_index));
}

std::string SigningEnclave::DeriveAddress(const config::NetworkConfig& network,
                                          const crypto::KeyDerivation& derivation) {
  OperationGuard guard(operation_mutex_);
  std::lock_guard<std::mutex> lock(state_mutex_);
  RequireUnlockedLocked();
  const auto root = OpenRootKeyLocked();
  const auto key = DeriveSigningKey(root, derivation);
  return crypto::AddressFromXOnlyKey(network.address_prefix, key.x_only_public_key());
}

}  // namespace kasstamp::wallet
