#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "payload/artifact_payload.hpp"
#include "primitives/amount.hpp"

namespace kasstamp::wallet {
class SigningEnclave;
}

namespace kasstamp::stamping {

// Position and SHA-256 hex digest of one stamped chunk. Digests are taken
// over the chunk bytes as sent, so private receipts list ciphertext digests.
struct ChunkRef {
  std::uint32_t index{0};
  std::uint32_t total{0};
  std::string digest;
};

// Proof-of-stamping record handed back to the user, one per artifact. In
// private mode the file metadata and transaction ids are replaced by
// ciphertext only the stamping wallet can open.
struct StampingReceipt {
  std::string id;
  std::string timestamp;
  std::string file_name;
  std::uint64_t file_size{0};
  std::string hash;
  std::optional<std::string> encrypted_metadata;
  payload::StampingMode mode{payload::StampingMode::kPublic};
  bool encrypted{false};
  bool compressed{false};
  std::string group_id;
  std::vector<std::string> transaction_ids;
  std::optional<std::string> encrypted_transaction_ids;
  std::vector<ChunkRef> chunks;
  std::size_t chunk_count{0};
  primitives::Amount total_cost_sompi{0};
  std::string network;
  std::string wallet_address;
};

struct ReceiptMetadata {
  std::string file_name;
  std::uint64_t file_size{0};
  std::string hash;
};

nlohmann::json ReceiptToJson(const StampingReceipt& receipt);
// Throws StampError(kMetadataJson) when required fields are missing or have
// the wrong type. Unknown fields are ignored.
StampingReceipt ReceiptFromJson(const nlohmann::json& value);
StampingReceipt ParseReceipt(const std::string& text);

// Moves file name, size, hash and transaction ids under the wallet key for
// the receipt's group id.
void SealPrivateReceipt(StampingReceipt& receipt, wallet::SigningEnclave& enclave);

// Plain metadata of a receipt; private receipts need an unlocked enclave.
ReceiptMetadata OpenReceiptMetadata(const StampingReceipt& receipt,
                                    wallet::SigningEnclave* enclave);
std::vector<std::string> OpenReceiptTransactionIds(const StampingReceipt& receipt,
                                                   wallet::SigningEnclave* enclave);

}  // namespace kasstamp::stamping
