#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "primitives/amount.hpp"

namespace kasstamp::primitives {

struct Outpoint {
  std::string transaction_id;  // 64 lowercase hex chars
  std::uint32_t index{0};

  bool operator==(const Outpoint& other) const = default;
};

struct UtxoEntry {
  Outpoint outpoint;
  Amount amount{0};
  std::uint16_t script_version{0};
  std::vector<std::uint8_t> script_public_key;
  std::string address;
  std::uint64_t block_daa_score{0};
  bool is_coinbase{false};
};

// DAA score given to change outputs of transactions that were just broadcast
// and are chained into the next transaction before confirmation.
inline constexpr std::uint64_t kVirtualDaaScore = std::numeric_limits<std::uint64_t>::max();

// Accepts JSON numbers and base-10 strings; anything else (negatives,
// fractions, overflow) is rejected.
bool ParseU64Field(const nlohmann::json& value, std::uint64_t* out);

// Converts a UTXO record as produced by node SDKs or RPC JSON. Both nested
// ({"outpoint": {"transactionId", "index"}, "scriptPublicKey": {"version",
// "script"}}) and flat ({"transactionId", "index", "scriptPublicKey": "<hex>"})
// shapes are understood.
std::optional<UtxoEntry> UtxoFromJson(const nlohmann::json& record, std::string* error = nullptr);

nlohmann::json UtxoToJson(const UtxoEntry& entry);

}  // namespace kasstamp::primitives
