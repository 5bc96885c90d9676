#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "primitives/amount.hpp"
#include "primitives/utxo.hpp"
#include "util/secure_wipe.hpp"

namespace kasstamp::chain {

struct PaymentOutput {
  std::string address;
  primitives::Amount amount{0};
};

struct TransactionRequest {
  std::vector<PaymentOutput> outputs;
  std::string change_address;
  std::vector<primitives::UtxoEntry> entries;
  std::vector<std::uint8_t> payload;
  primitives::Amount priority_fee{0};
  std::string network_id;
};

struct TransactionEstimate {
  std::size_t transaction_count{0};
  primitives::Amount fees{0};
  std::uint64_t mass{0};
  std::size_t utxo_count{0};
  primitives::Amount final_amount{0};
};

// Private key handed to PendingTransaction::Sign for the duration of one
// signing call. The secret is wiped when the object is destroyed.
class SigningKey {
 public:
  SigningKey(util::SecureBytes secret, const std::array<std::uint8_t, 32>& x_only_public_key)
      : secret_(std::move(secret)), x_only_public_key_(x_only_public_key) {}
  SigningKey(SigningKey&&) noexcept = default;
  SigningKey& operator=(SigningKey&&) noexcept = default;
  SigningKey(const SigningKey&) = delete;
  SigningKey& operator=(const SigningKey&) = delete;

  std::span<const std::uint8_t> secret() const noexcept { return secret_.span(); }
  const std::array<std::uint8_t, 32>& x_only_public_key() const noexcept {
    return x_only_public_key_;
  }

 private:
  util::SecureBytes secret_;
  std::array<std::uint8_t, 32> x_only_public_key_{};
};

// A transaction built by the chain service and not yet broadcast.
class PendingTransaction {
 public:
  virtual ~PendingTransaction() = default;

  virtual std::string Id() const = 0;
  // Addresses of the inputs; every one needs a matching key before submission.
  virtual std::vector<std::string> Addresses() const = 0;
  // Throws StampError(kTransactionFailed) when an input has no matching key.
  virtual void Sign(std::span<const SigningKey> keys) = 0;
  virtual bool IsSigned() const = 0;
  virtual std::uint64_t Mass() const = 0;
  virtual primitives::Amount Fee() const = 0;
  virtual std::span<const std::uint8_t> Payload() const = 0;
  // Output that returns funds to the change address, with its outpoint
  // already filled in. Empty when the transaction has no change.
  virtual std::optional<primitives::UtxoEntry> ChangeOutput() const = 0;
};

class ChainTransactionService {
 public:
  virtual ~ChainTransactionService() = default;

  virtual TransactionEstimate Estimate(const TransactionRequest& request) = 0;
  virtual std::vector<std::unique_ptr<PendingTransaction>> Create(
      const TransactionRequest& request) = 0;
  // Returns the id of the accepted transaction. Throws StampError with a
  // network category when the transaction is rejected.
  virtual std::string Submit(PendingTransaction& transaction) = 0;
};

class UtxoProvider {
 public:
  virtual ~UtxoProvider() = default;

  virtual std::vector<primitives::UtxoEntry> GetUtxos(
      const std::vector<std::string>& addresses) = 0;
};

}  // namespace kasstamp::chain
