#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "chain/transaction_service.hpp"
#include "config/network.hpp"
#include "stamping/artifact_preparation.hpp"
#include "stamping/stamping_receipt.hpp"
#include "stamping/transaction_chain.hpp"

namespace kasstamp::wallet {
class SigningEnclave;
}

namespace kasstamp::stamping {

struct BatcherOptions {
  payload::StampingMode mode{payload::StampingMode::kPublic};
  PreparationOptions preparation;
  primitives::Amount priority_fee{0};
  std::uint32_t account_index{0};
  config::NetworkConfig network;
};

struct ArtifactEstimate {
  std::string name;
  std::size_t chunk_count{0};
  std::size_t transaction_count{0};
  primitives::Amount total_fees{0};
  std::uint64_t total_mass{0};
  std::size_t payload_bytes{0};
  bool within_mass_limit{true};
  std::optional<std::string> error;
};

struct StampingEstimation {
  std::vector<ArtifactEstimate> artifacts;
  // Wallet UTXOs the estimate spent (the largest one, as Commit does); zero
  // when the wallet is locked or unfunded.
  std::size_t utxo_count{0};
  std::string change_address;
  std::size_t chunk_count{0};
  std::size_t transaction_count{0};
  primitives::Amount total_fees{0};
  std::uint64_t total_mass{0};
  std::size_t payload_bytes{0};
};

enum class ArtifactStampStatus {
  kComplete,
  kPartial,
  kNotSubmitted,
  kFailed,
};

std::string_view ArtifactStampStatusName(ArtifactStampStatus status);

struct ArtifactStampResult {
  std::string name;
  ArtifactStampStatus status{ArtifactStampStatus::kNotSubmitted};
  // Ids already broadcast for this artifact, also for partial outcomes.
  std::vector<std::string> transaction_ids;
  primitives::Amount fees{0};
  std::optional<StampingReceipt> receipt;
  std::optional<std::string> error;
};

struct BatchResult {
  std::vector<ArtifactStampResult> artifacts;
  std::vector<std::string> transaction_ids;
  primitives::Amount total_fees{0};
  bool cancelled{false};

  bool all_complete() const noexcept;
};

// Drives a set of artifacts through preparation, transaction construction,
// enclave signing and sequential submission. All payloads of all artifacts
// form one chain funded by the wallet's largest UTXO.
class TransactionBatcher {
 public:
  TransactionBatcher(chain::ChainTransactionService& service, chain::UtxoProvider& utxos,
                     wallet::SigningEnclave& enclave, BatcherOptions options);

  // Read-only cost preview; nothing is signed or submitted.
  StampingEstimation Estimate(const std::vector<ArtifactInput>& artifacts);

  BatchResult Commit(const std::vector<ArtifactInput>& artifacts,
                     const CancellationToken* cancel = nullptr,
                     const ChainProgress& progress = {});

  const BatcherOptions& options() const noexcept { return options_; }

 private:
  chain::ChainTransactionService& service_;
  chain::UtxoProvider& utxos_;
  wallet::SigningEnclave& enclave_;
  BatcherOptions options_;
};

}  // namespace kasstamp::stamping
