#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "chain/transaction_service.hpp"
#include "util/error.hpp"

namespace kasstamp::stamping {

class CancellationToken {
 public:
  void Cancel() noexcept { cancelled_.store(true); }
  bool IsCancelled() const noexcept { return cancelled_.load(); }

 private:
  std::atomic<bool> cancelled_{false};
};

struct ChainOptions {
  std::string change_address;
  // Optional explicit payment; zero means payload plus change only.
  std::string receive_address;
  primitives::Amount output_amount{0};
  primitives::Amount priority_fee{0};
  std::string network_id;
};

struct ChainedTransactionResult {
  std::string transaction_id;
  primitives::Amount fee{0};
  std::uint64_t mass{0};
  // Change output, chained into the next transaction before confirmation.
  std::optional<primitives::UtxoEntry> virtual_utxo;
};

using SigningFunction = std::function<void(chain::PendingTransaction&)>;
using ChainProgress = std::function<void(std::size_t submitted, std::size_t total)>;

// Builds, capacity-checks, signs and submits one payload-carrying
// transaction spending `inputs`.
ChainedTransactionResult SubmitChainedTransaction(chain::ChainTransactionService& service,
                                                  std::vector<primitives::UtxoEntry> inputs,
                                                  std::span<const std::uint8_t> payload,
                                                  const SigningFunction& sign,
                                                  const ChainOptions& options);

struct ChainFailure {
  std::size_t payload_index{0};
  util::ErrorCode code{util::ErrorCode::kTransactionFailed};
  std::string message;
};

struct ChainRunResult {
  std::vector<ChainedTransactionResult> submitted;
  bool cancelled{false};
  std::optional<ChainFailure> failure;

  bool complete(std::size_t total) const noexcept {
    return !cancelled && !failure && submitted.size() == total;
  }
};

// Submits the payloads strictly in order: transaction N + 1 spends the change
// of transaction N. Stops at the first failure or when `cancel` is set;
// nothing already broadcast is rolled back.
ChainRunResult RunTransactionChain(chain::ChainTransactionService& service,
                                   std::vector<primitives::UtxoEntry> initial_inputs,
                                   std::span<const std::vector<std::uint8_t>> payloads,
                                   const SigningFunction& sign, const ChainOptions& options,
                                   const CancellationToken* cancel = nullptr,
                                   const ChainProgress& progress = {});

}  // namespace kasstamp::stamping
