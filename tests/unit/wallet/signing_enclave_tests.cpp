#include <array>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include "chain/transaction_service.hpp"
#include "config/network.hpp"
#include "crypto/address.hpp"
#include "util/aead.hpp"
#include "util/csprng.hpp"
#include "util/error.hpp"
#include "util/hex.hpp"
#include "util/pbkdf2.hpp"
#include "wallet/enclave_blob.hpp"
#include "wallet/key_value_storage.hpp"
#include "wallet/signing_enclave.hpp"

using namespace kasstamp;
using util::ErrorCode;
using util::StampError;

namespace {

constexpr const char* kMnemonic =
    "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon "
    "about";
constexpr const char* kPassword = "correct horse battery";

template <typename Fn>
bool ThrowsCode(Fn&& fn, ErrorCode code) {
  try {
    fn();
  } catch (const StampError& e) {
    return e.code() == code;
  }
  return false;
}

wallet::EnclaveOptions FastOptions(const std::string& wallet_id = "default") {
  wallet::EnclaveOptions options;
  options.wallet_id = wallet_id;
  options.kdf_params = {1, 64, 1};
  return options;
}

// Records the keys handed over by the enclave; optionally runs a hook while
// the enclave is inside its signing call.
class RecordingTransaction final : public chain::PendingTransaction {
 public:
  explicit RecordingTransaction(std::vector<std::string> addresses)
      : addresses_(std::move(addresses)) {}

  std::string Id() const override { return "recording"; }
  std::vector<std::string> Addresses() const override { return addresses_; }
  void Sign(std::span<const chain::SigningKey> keys) override {
    for (const auto& key : keys) {
      signed_by.push_back(key.x_only_public_key());
    }
    if (during_sign) {
      during_sign();
    }
  }
  bool IsSigned() const override { return !signed_by.empty(); }
  std::uint64_t Mass() const override { return 0; }
  primitives::Amount Fee() const override { return 0; }
  std::span<const std::uint8_t> Payload() const override { return {}; }
  std::optional<primitives::UtxoEntry> ChangeOutput() const override { return std::nullopt; }

  std::vector<std::array<std::uint8_t, 32>> signed_by;
  std::function<void()> during_sign;

 private:
  std::vector<std::string> addresses_;
};

}  // namespace

int main() {
  try {
    const auto& testnet = config::ConfigFor(config::NetworkType::kTestnet10);

    {
      wallet::MemoryStorage storage;
      wallet::SigningEnclave enclave(storage, FastOptions());
      if (enclave.HasMnemonic() || !enclave.IsLocked()) {
        std::cerr << "fresh enclave should be empty and locked\n";
        return EXIT_FAILURE;
      }
      if (!ThrowsCode([&] { enclave.Unlock(kPassword); }, ErrorCode::kNoMnemonic)) {
        std::cerr << "unlock without a mnemonic did not report kNoMnemonic\n";
        return EXIT_FAILURE;
      }
      if (!ThrowsCode([&] { enclave.StoreMnemonic("not a mnemonic", kPassword); },
                      ErrorCode::kInvalidArgument)) {
        std::cerr << "malformed mnemonic stored\n";
        return EXIT_FAILURE;
      }
      if (!ThrowsCode([&] { enclave.StoreMnemonic(kMnemonic, "short"); },
                      ErrorCode::kInvalidArgument)) {
        std::cerr << "short password accepted\n";
        return EXIT_FAILURE;
      }

      enclave.StoreMnemonic(kMnemonic, kPassword);
      const auto stored = storage.GetItem("default.enclave");
      if (!stored || !util::IsHexString(*stored) || stored->find("abandon") != std::string::npos) {
        std::cerr << "stored blob is not opaque hex\n";
        return EXIT_FAILURE;
      }
      if (!enclave.HasMnemonic() || !enclave.IsLocked()) {
        std::cerr << "storing must leave the enclave locked\n";
        return EXIT_FAILURE;
      }
      if (!ThrowsCode([&] { enclave.DeriveAddress(testnet, {}); }, ErrorCode::kLocked)) {
        std::cerr << "locked enclave derived an address\n";
        return EXIT_FAILURE;
      }
      RecordingTransaction before_unlock({"kaspatest:any"});
      if (!ThrowsCode([&] { enclave.Sign(before_unlock); }, ErrorCode::kLocked) ||
          !before_unlock.signed_by.empty()) {
        std::cerr << "enclave signed before its first unlock\n";
        return EXIT_FAILURE;
      }
      if (!ThrowsCode([&] { enclave.Unlock("wrong password!"); }, ErrorCode::kWrongPassword)) {
        std::cerr << "wrong password not rejected\n";
        return EXIT_FAILURE;
      }
      if (!enclave.IsLocked()) {
        std::cerr << "rejected unlock left the enclave open\n";
        return EXIT_FAILURE;
      }

      enclave.Unlock(kPassword, std::chrono::minutes(5));
      const auto status = enclave.GetStatus();
      if (status.is_locked || !status.has_mnemonic ||
          status.time_until_lock <= std::chrono::milliseconds(0) ||
          status.time_until_lock > std::chrono::minutes(5)) {
        std::cerr << "status after unlock is wrong\n";
        return EXIT_FAILURE;
      }

      // A wrong password on an open enclave neither locks it nor extends its expiry.
      if (!ThrowsCode([&] { enclave.Unlock("wrong password!", std::chrono::minutes(30)); },
                      ErrorCode::kWrongPassword)) {
        std::cerr << "wrong password accepted by an unlocked enclave\n";
        return EXIT_FAILURE;
      }
      const auto after_rejected = enclave.GetStatus();
      if (after_rejected.is_locked ||
          after_rejected.time_until_lock > status.time_until_lock ||
          after_rejected.time_until_lock < status.time_until_lock - std::chrono::minutes(1)) {
        std::cerr << "rejected re-unlock changed the session expiry\n";
        return EXIT_FAILURE;
      }
      const auto receive = enclave.DeriveAddress(testnet, {0, 0, true});
      const auto change = enclave.DeriveAddress(testnet, {0, 0, false});
      if (receive == change || receive != enclave.DeriveAddress(testnet, {0, 0, true}) ||
          receive.rfind("kaspatest:", 0) != 0 || !crypto::DecodeAddress(receive)) {
        std::cerr << "derived addresses are not stable and distinct\n";
        return EXIT_FAILURE;
      }

      // Wallet-key encryption is bound to the group id.
      const std::vector<std::uint8_t> secret{9, 8, 7, 6};
      const auto sealed = enclave.EncryptWithWalletKey(secret, "group-1");
      if (enclave.DecryptWithWalletKey(sealed, "group-1") != secret) {
        std::cerr << "wallet-key round trip failed\n";
        return EXIT_FAILURE;
      }
      if (!ThrowsCode([&] { enclave.DecryptWithWalletKey(sealed, "group-2"); },
                      ErrorCode::kAuthenticationFailed) ||
          !ThrowsCode([&] { enclave.DecryptWithWalletKey(sealed, "group-1", 1); },
                      ErrorCode::kAuthenticationFailed)) {
        std::cerr << "wallet-key envelope opened under another group or account\n";
        return EXIT_FAILURE;
      }

      // Auto-discovery signs with the key of every input address.
      RecordingTransaction tx({change, receive});
      enclave.SignWithAutoDiscovery(tx, testnet);
      if (tx.signed_by.size() != 2) {
        std::cerr << "auto-discovery found " << tx.signed_by.size() << " keys, expected 2\n";
        return EXIT_FAILURE;
      }
      RecordingTransaction foreign({receive, "kaspatest:foreign"});
      if (!ThrowsCode([&] { enclave.SignWithAutoDiscovery(foreign, testnet); },
                      ErrorCode::kKeyNotFound) ||
          !foreign.signed_by.empty()) {
        std::cerr << "unknown input address was not reported\n";
        return EXIT_FAILURE;
      }

      // A second caller during an operation is turned away.
      RecordingTransaction busy({receive});
      std::optional<ErrorCode> concurrent_error;
      busy.during_sign = [&] {
        std::thread other([&] {
          try {
            enclave.DeriveAddress(testnet, {});
          } catch (const StampError& e) {
            concurrent_error = e.code();
          }
        });
        other.join();
      };
      enclave.Sign(busy);
      if (concurrent_error != ErrorCode::kBusy) {
        std::cerr << "concurrent operation was not rejected as busy\n";
        return EXIT_FAILURE;
      }

      enclave.Lock();
      if (!enclave.IsLocked() ||
          !ThrowsCode([&] { enclave.EncryptWithWalletKey(secret, "group-1"); },
                      ErrorCode::kLocked)) {
        std::cerr << "lock did not revoke access\n";
        return EXIT_FAILURE;
      }
      RecordingTransaction after_lock({receive});
      if (!ThrowsCode([&] { enclave.Sign(after_lock); }, ErrorCode::kLocked) ||
          !after_lock.signed_by.empty()) {
        std::cerr << "enclave signed after Lock()\n";
        return EXIT_FAILURE;
      }

      // Keys come back after relocking and unlocking.
      enclave.Unlock(kPassword);
      if (enclave.DecryptWithWalletKey(sealed, "group-1") != secret) {
        std::cerr << "wallet key changed across lock cycles\n";
        return EXIT_FAILURE;
      }

      // Passphrases select a different wallet.
      wallet::MemoryStorage other_storage;
      wallet::SigningEnclave with_passphrase(other_storage, FastOptions());
      with_passphrase.StoreMnemonic(kMnemonic, kPassword, "TREZOR");
      with_passphrase.Unlock(kPassword);
      if (with_passphrase.DeriveAddress(testnet, {}) == receive) {
        std::cerr << "passphrase did not change the derived wallet\n";
        return EXIT_FAILURE;
      }

      enclave.Clear();
      if (enclave.HasMnemonic() || storage.GetItem("default.enclave")) {
        std::cerr << "clear left the blob behind\n";
        return EXIT_FAILURE;
      }
    }

    {
      wallet::MemoryStorage storage;
      wallet::SigningEnclave enclave(storage, FastOptions());
      enclave.StoreMnemonic(kMnemonic, kPassword);
      enclave.Unlock(kPassword, std::chrono::milliseconds(20));
      std::this_thread::sleep_for(std::chrono::milliseconds(60));
      // Signing is the first call after expiry.
      RecordingTransaction expired({"kaspatest:any"});
      if (!ThrowsCode([&] { enclave.Sign(expired); }, ErrorCode::kLocked) ||
          !expired.signed_by.empty()) {
        std::cerr << "enclave signed after its auto-lock expired\n";
        return EXIT_FAILURE;
      }
      if (!enclave.IsLocked()) {
        std::cerr << "enclave did not auto-lock\n";
        return EXIT_FAILURE;
      }
      enclave.Unlock(kPassword, std::chrono::milliseconds(20));
      std::this_thread::sleep_for(std::chrono::milliseconds(60));
      enclave.Tick();
      if (!ThrowsCode([&] { enclave.DeriveAddress(testnet, {}); }, ErrorCode::kLocked)) {
        std::cerr << "tick did not lock an expired enclave\n";
        return EXIT_FAILURE;
      }
      enclave.Unlock(kPassword, std::chrono::milliseconds(0));
      std::this_thread::sleep_for(std::chrono::milliseconds(30));
      if (enclave.IsLocked()) {
        std::cerr << "zero auto-lock should keep the enclave open\n";
        return EXIT_FAILURE;
      }
    }

    {
      // Version 1 blobs written by older wallets still unlock.
      const std::string password = "legacy-password";
      const auto salt = util::SecureRandomBytes(wallet::kEnclaveSaltSize);
      const auto nonce = util::SecureRandomBytes(util::kAes256GcmNonceSize);
      const auto key = util::Pbkdf2HmacSha256(password, salt, wallet::kLegacyPbkdf2Iterations,
                                              util::kAes256GcmKeySize);
      const std::string mnemonic(kMnemonic);
      const std::vector<std::uint8_t> plaintext(mnemonic.begin(), mnemonic.end());
      const auto sealed = util::Aes256GcmEncrypt(key, nonce, {}, plaintext);
      wallet::EnclaveBlob legacy;
      legacy.version = wallet::kEnclaveBlobLegacyVersion;
      legacy.salt = salt;
      legacy.cipher = nonce;
      legacy.cipher.insert(legacy.cipher.end(), sealed.begin(), sealed.end());

      const auto dir =
          std::filesystem::temp_directory_path() / ("kasstamp-enclave-" + util::RandomUuidV4());
      wallet::DirectoryStorage storage(dir);
      storage.SetItem("legacy.enclave", util::HexEncode(wallet::SerializeEnclaveBlob(legacy)));
      if (!ThrowsCode([&] { storage.SetItem("../escape", "x"); }, ErrorCode::kInvalidArgument)) {
        std::cerr << "directory storage accepted a path-like key\n";
        return EXIT_FAILURE;
      }

      wallet::SigningEnclave legacy_enclave(storage, FastOptions("legacy"));
      legacy_enclave.Unlock(password);
      wallet::SigningEnclave modern(storage, FastOptions("modern"));
      modern.StoreMnemonic(kMnemonic, kPassword);
      modern.Unlock(kPassword);
      if (legacy_enclave.DeriveAddress(testnet, {}) != modern.DeriveAddress(testnet, {})) {
        std::cerr << "legacy blob opened to a different wallet\n";
        return EXIT_FAILURE;
      }

      // A second instance over the same directory sees the stored wallet.
      wallet::SigningEnclave reopened(storage, FastOptions("modern"));
      if (!reopened.HasMnemonic() || !reopened.IsLocked()) {
        std::cerr << "stored wallet did not persist\n";
        return EXIT_FAILURE;
      }
      std::filesystem::remove_all(dir);
    }
  } catch (const std::exception& ex) {
    std::cerr << "signing_enclave_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }

  std::cout << "signing_enclave_tests: OK\n";
  return 0;
}
