#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "chain/transaction_service.hpp"
#include "nlohmann/json.hpp"
#include "primitives/transaction.hpp"

namespace kasstamp::chain {

struct OfflineChainOptions {
  std::string network_id{"mainnet"};
  std::string address_prefix{"kaspa"};
  // Append-only JSON-lines record of funding entries and accepted
  // transactions. Replayed by Load().
  std::optional<std::filesystem::path> journal_path;
  // Minimum relay fee in sompi per gram of mass.
  primitives::Amount fee_rate{1};
};

// Local stand-in for a node: builds and signs transactions with the same
// interfaces as a networked service, validates spends and signatures on
// submission and keeps the resulting UTXO set and payloads.
class OfflineChainService final : public ChainTransactionService, public UtxoProvider {
 public:
  explicit OfflineChainService(OfflineChainOptions options);

  // Replays the journal, if one is configured and present.
  void Load();

  // Creates a spendable output out of thin air (an offline faucet).
  primitives::UtxoEntry Fund(const std::string& address, primitives::Amount amount);

  TransactionEstimate Estimate(const TransactionRequest& request) override;
  std::vector<std::unique_ptr<PendingTransaction>> Create(const TransactionRequest& request) override;
  std::string Submit(PendingTransaction& transaction) override;
  std::vector<primitives::UtxoEntry> GetUtxos(const std::vector<std::string>& addresses) override;

  std::optional<std::vector<std::uint8_t>> GetPayload(const std::string& transaction_id) const;
  std::optional<primitives::Transaction> GetTransaction(const std::string& transaction_id) const;
  std::size_t transaction_count() const;
  std::size_t utxo_count() const;

 private:
  void AppendJournal(const nlohmann::json& record);
  void ApplyTransaction(const std::string& id, const primitives::Transaction& tx);
  void AddUtxo(primitives::UtxoEntry entry);

  OfflineChainOptions options_;
  mutable std::mutex mutex_;
  std::map<std::string, primitives::UtxoEntry> utxos_;
  std::map<std::string, primitives::Transaction> transactions_;
  std::uint64_t daa_score_{0};
  std::uint64_t fund_counter_{0};
};

}  // namespace kasstamp::chain
