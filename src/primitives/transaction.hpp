#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "primitives/amount.hpp"
#include "primitives/utxo.hpp"

namespace kasstamp::primitives {

struct TxInput {
  Outpoint previous_outpoint;
  std::vector<std::uint8_t> signature_script;
  std::uint64_t sequence{0};
  std::uint8_t sig_op_count{1};
};

struct TxOutput {
  Amount value{0};
  std::uint16_t script_version{0};
  std::vector<std::uint8_t> script_public_key;
};

struct Transaction {
  std::uint16_t version{0};
  std::vector<TxInput> inputs;
  std::vector<TxOutput> outputs;
  std::uint64_t lock_time{0};
  std::vector<std::uint8_t> payload;
};

// Mass weights applied by ComputeTransactionMass.
inline constexpr std::uint64_t kMassPerTxByte = 1;
inline constexpr std::uint64_t kMassPerScriptPubKeyByte = 10;
inline constexpr std::uint64_t kMassPerSigOp = 1000;

void WriteUint16(std::vector<std::uint8_t>* out, std::uint16_t value);
void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value);
void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value);

// Signature scripts are skipped when include_signatures is false so that the
// transaction id does not change once inputs are signed.
void SerializeTransaction(const Transaction& tx, std::vector<std::uint8_t>* out,
                          bool include_signatures = true);

// Lowercase hex SHA-256 of the signature-less serialization.
std::string ComputeTransactionId(const Transaction& tx);

// Digest signed by every input. Commits to the signature-less serialization
// and the input index.
std::vector<std::uint8_t> SignatureHash(const Transaction& tx, std::size_t input_index);

// Compute mass of the fully signed transaction: serialized size, locking
// script bytes and signature operations.
std::uint64_t ComputeTransactionMass(const Transaction& tx);

nlohmann::json TransactionToJson(const Transaction& tx);
std::optional<Transaction> TransactionFromJson(const nlohmann::json& value,
                                               std::string* error = nullptr);

}  // namespace kasstamp::primitives
