#include "stamping/stamping_receipt.hpp"

#include <cmath>
#include <limits>

#include "util/base64.hpp"
#include "util/error.hpp"
#include "util/hex.hpp"
#include "wallet/signing_enclave.hpp"

namespace kasstamp::stamping {

namespace {

[[noreturn]] void BadReceipt(const std::string& message) {
  util::Fail(util::ErrorCode::kMetadataJson, "invalid receipt: " + message);
}

std::string RequireString(const nlohmann::json& value, const char* key) {
  const auto it = value.find(key);
  if (it == value.end() || !it->is_string()) {
    BadReceipt(std::string("'") + key + "' must be a string");
  }
  return it->get<std::string>();
}

bool OptionalBool(const nlohmann::json& value, const char* key) {
  const auto it = value.find(key);
  if (it == value.end() || it->is_null()) {
    return false;
  }
  if (!it->is_boolean()) {
    BadReceipt(std::string("'") + key + "' must be a boolean");
  }
  return it->get<bool>();
}

std::string OptionalString(const nlohmann::json& value, const char* key) {
  const auto it = value.find(key);
  if (it == value.end() || it->is_null()) {
    return {};
  }
  if (!it->is_string()) {
    BadReceipt(std::string("'") + key + "' must be a string");
  }
  return it->get<std::string>();
}

// 2^64; every double below it converts to uint64 without overflow.
constexpr double kU64Limit = 18446744073709551616.0;

bool WholeNumber(double value, std::uint64_t* out) {
  if (!std::isfinite(value) || value < 0 || value >= kU64Limit || std::floor(value) != value) {
    return false;
  }
  *out = static_cast<std::uint64_t>(value);
  return true;
}

std::uint64_t CountField(const nlohmann::json& field, const std::string& name) {
  std::uint64_t count = 0;
  if (field.is_number_unsigned()) {
    return field.get<std::uint64_t>();
  }
  if (field.is_number_integer() && field.get<std::int64_t>() >= 0) {
    return static_cast<std::uint64_t>(field.get<std::int64_t>());
  }
  if (field.is_number_float() && WholeNumber(field.get<double>(), &count)) {
    return count;
  }
  BadReceipt("'" + name + "' must be a non-negative integer below 2^64");
}

std::uint64_t RequireCount(const nlohmann::json& value, const char* key) {
  const auto it = value.find(key);
  if (it == value.end()) {
    BadReceipt(std::string("'") + key + "' is missing");
  }
  return CountField(*it, key);
}

std::uint32_t ChunkPosition(const nlohmann::json& chunk, const char* key) {
  const auto it = chunk.find(key);
  if (it == chunk.end()) {
    BadReceipt(std::string("chunk '") + key + "' is missing");
  }
  const auto position = CountField(*it, std::string("chunk ") + key);
  if (position > std::numeric_limits<std::uint32_t>::max()) {
    BadReceipt(std::string("chunk '") + key + "' does not fit in 32 bits");
  }
  return static_cast<std::uint32_t>(position);
}

std::vector<ChunkRef> ReadChunks(const nlohmann::json& value) {
  const auto it = value.find("chunks");
  if (it == value.end() || it->is_null()) {
    return {};
  }
  if (!it->is_array()) {
    BadReceipt("'chunks' must be an array");
  }
  std::vector<ChunkRef> chunks;
  chunks.reserve(it->size());
  for (const auto& chunk : *it) {
    if (!chunk.is_object()) {
      BadReceipt("'chunks' entries must be objects");
    }
    ChunkRef ref;
    ref.index = ChunkPosition(chunk, "index");
    ref.total = ChunkPosition(chunk, "total");
    ref.digest = RequireString(chunk, "digest");
    if (ref.digest.size() != 64 || !util::IsHexString(ref.digest)) {
      BadReceipt("chunk digest must be 64 hex characters");
    }
    if (ref.index >= ref.total) {
      BadReceipt("chunk index " + std::to_string(ref.index) + " is not below its total " +
                 std::to_string(ref.total));
    }
    chunks.push_back(std::move(ref));
  }
  return chunks;
}

// Older receipts only carry the KAS figure; it is converted back to whole sompi.
primitives::Amount CostFromKas(const nlohmann::json& kas) {
  std::uint64_t sompi = 0;
  if (!kas.is_number() ||
      !WholeNumber(std::round(kas.get<double>() * static_cast<double>(primitives::kSompiPerKas)),
                   &sompi)) {
    BadReceipt("'totalCostKAS' must be a non-negative amount below 2^64 sompi");
  }
  return sompi;
}

std::vector<std::uint8_t> ToBytes(const std::string& text) {
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

std::vector<std::uint8_t> DecodeBase64Field(const std::string& text, const char* field) {
  std::vector<std::uint8_t> bytes;
  if (!util::Base64Decode(text, &bytes)) {
    BadReceipt(std::string("'") + field + "' is not valid base64");
  }
  return bytes;
}

wallet::SigningEnclave& RequireEnclave(wallet::SigningEnclave* enclave) {
  if (!enclave) {
    util::Fail(util::ErrorCode::kLocked,
               "a signing enclave is required to open a private receipt");
  }
  return *enclave;
}

}  // namespace

nlohmann::json ReceiptToJson(const StampingReceipt& receipt) {
  nlohmann::json out = {
      {"id", receipt.id},
      {"timestamp", receipt.timestamp},
      {"fileName", receipt.file_name},
      {"fileSize", receipt.file_size},
      {"hash", receipt.hash},
      {"mode", std::string(payload::StampingModeName(receipt.mode))},
      {"privacy", std::string(payload::StampingModeName(receipt.mode))},
      {"encrypted", receipt.encrypted},
      {"compressed", receipt.compressed},
      {"chunkCount", receipt.chunk_count},
      {"totalCostKAS",
       static_cast<double>(receipt.total_cost_sompi) / static_cast<double>(primitives::kSompiPerKas)},
      {"totalCostSompi", std::to_string(receipt.total_cost_sompi)},
  };
  if (!receipt.group_id.empty()) {
    out["groupId"] = receipt.group_id;
  }
  if (receipt.encrypted_metadata) {
    out["encryptedMetadata"] = *receipt.encrypted_metadata;
  }
  auto chunks = nlohmann::json::array();
  for (const auto& chunk : receipt.chunks) {
    chunks.push_back(
        nlohmann::json{{"index", chunk.index}, {"total", chunk.total}, {"digest", chunk.digest}});
  }
  out["chunks"] = std::move(chunks);
  if (receipt.encrypted_transaction_ids) {
    out["transactionIds"] = *receipt.encrypted_transaction_ids;
    out["transactionIdsEncrypted"] = true;
  } else {
    out["transactionIds"] = receipt.transaction_ids;
    out["transactionIdsEncrypted"] = false;
  }
  if (!receipt.network.empty()) {
    out["network"] = receipt.network;
  }
  if (!receipt.wallet_address.empty()) {
    out["walletAddress"] = receipt.wallet_address;
  }
  return out;
}

StampingReceipt ReceiptFromJson(const nlohmann::json& value) {
  if (!value.is_object()) {
    BadReceipt("receipt must be a JSON object");
  }
  StampingReceipt receipt;
  receipt.id = RequireString(value, "id");
  receipt.timestamp = OptionalString(value, "timestamp");
  receipt.file_name = RequireString(value, "fileName");
  receipt.file_size = RequireCount(value, "fileSize");
  receipt.hash = RequireString(value, "hash");
  const std::string encrypted_metadata = OptionalString(value, "encryptedMetadata");
  if (!encrypted_metadata.empty()) {
    receipt.encrypted_metadata = encrypted_metadata;
  }
  std::string mode_name = OptionalString(value, "mode");
  if (mode_name.empty()) {
    mode_name = OptionalString(value, "privacy");
  }
  const auto mode = payload::ParseStampingMode(mode_name);
  if (!mode) {
    BadReceipt("'mode' must be \"public\" or \"private\"");
  }
  receipt.mode = *mode;
  receipt.encrypted = OptionalBool(value, "encrypted");
  receipt.compressed = OptionalBool(value, "compressed");
  receipt.group_id = OptionalString(value, "groupId");

  const auto ids = value.find("transactionIds");
  if (ids == value.end()) {
    BadReceipt("'transactionIds' is missing");
  }
  if (ids->is_string()) {
    receipt.encrypted_transaction_ids = ids->get<std::string>();
  } else if (ids->is_array()) {
    for (const auto& id : *ids) {
      if (!id.is_string()) {
        BadReceipt("'transactionIds' entries must be strings");
      }
      receipt.transaction_ids.push_back(id.get<std::string>());
    }
  } else {
    BadReceipt("'transactionIds' must be an array or an encrypted string");
  }
  receipt.chunk_count = static_cast<std::size_t>(RequireCount(value, "chunkCount"));
  receipt.chunks = ReadChunks(value);

  const auto sompi = value.find("totalCostSompi");
  const auto kas = value.find("totalCostKAS");
  std::uint64_t cost = 0;
  if (sompi != value.end() && primitives::ParseU64Field(*sompi, &cost)) {
    receipt.total_cost_sompi = cost;
  } else if (kas != value.end() && !kas->is_null()) {
    receipt.total_cost_sompi = CostFromKas(*kas);
  }
  receipt.network = OptionalString(value, "network");
  receipt.wallet_address = OptionalString(value, "walletAddress");
  return receipt;
}

StampingReceipt ParseReceipt(const std::string& text) {
  const auto value = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (value.is_discarded()) {
    BadReceipt("not valid JSON");
  }
  return ReceiptFromJson(value);
}

void SealPrivateReceipt(StampingReceipt& receipt, wallet::SigningEnclave& enclave) {
  if (receipt.group_id.empty()) {
    util::Fail(util::ErrorCode::kInvalidArgument, "private receipt needs a group id");
  }
  const nlohmann::json metadata = {
      {"fileName", receipt.file_name},
      {"fileSize", receipt.file_size},
      {"hash", receipt.hash},
  };
  const auto sealed_metadata =
      enclave.EncryptWithWalletKey(ToBytes(metadata.dump()), receipt.group_id);
  const auto sealed_ids = enclave.EncryptWithWalletKey(
      ToBytes(nlohmann::json(receipt.transaction_ids).dump()), receipt.group_id);

  receipt.encrypted_metadata = util::Base64Encode(sealed_metadata);
  receipt.encrypted_transaction_ids = util::Base64Encode(sealed_ids);
  receipt.transaction_ids.clear();
  receipt.file_name = std::string(payload::kRedactedField);
  receipt.file_size = 0;
  receipt.hash = std::string(payload::kRedactedField);
}

ReceiptMetadata OpenReceiptMetadata(const StampingReceipt& receipt,
                                    wallet::SigningEnclave* enclave) {
  if (!receipt.encrypted_metadata) {
    return {receipt.file_name, receipt.file_size, receipt.hash};
  }
  const auto ciphertext = DecodeBase64Field(*receipt.encrypted_metadata, "encryptedMetadata");
  const auto plaintext =
      RequireEnclave(enclave).DecryptWithWalletKey(ciphertext, receipt.group_id);
  const auto value = nlohmann::json::parse(plaintext.begin(), plaintext.end(), nullptr,
                                           /*allow_exceptions=*/false);
  if (!value.is_object()) {
    BadReceipt("decrypted metadata is not a JSON object");
  }
  ReceiptMetadata metadata;
  metadata.file_name = RequireString(value, "fileName");
  metadata.file_size = RequireCount(value, "fileSize");
  metadata.hash = RequireString(value, "hash");
  return metadata;
}

std::vector<std::string> OpenReceiptTransactionIds(const StampingReceipt& receipt,
                                                   wallet::SigningEnclave* enclave) {
  if (!receipt.encrypted_transaction_ids) {
    return receipt.transaction_ids;
  }
  if (receipt.group_id.empty()) {
    BadReceipt("groupId is required to decrypt transaction ids");
  }
  const auto ciphertext = DecodeBase64Field(*receipt.encrypted_transaction_ids, "transactionIds");
  const auto plaintext =
      RequireEnclave(enclave).DecryptWithWalletKey(ciphertext, receipt.group_id);
  const auto value = nlohmann::json::parse(plaintext.begin(), plaintext.end(), nullptr,
                                           /*allow_exceptions=*/false);
  if (!value.is_array()) {
    BadReceipt("decrypted transaction ids are not a JSON array");
  }
  std::vector<std::string> ids;
  for (const auto& id : value) {
    if (!id.is_string()) {
      BadReceipt("decrypted transaction ids must be strings");
    }
    ids.push_back(id.get<std::string>());
  }
  return ids;
}

}  // namespace kasstamp::stamping
