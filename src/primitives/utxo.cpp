#include "primitives/utxo.hpp"

#include <cctype>

#include "util/hex.hpp"

namespace kasstamp::primitives {

namespace {

bool Reject(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
  return false;
}

const nlohmann::json* FindField(const nlohmann::json& object, const char* name) {
  const auto it = object.find(name);
  if (it == object.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

}  // namespace

bool ParseU64Field(const nlohmann::json& value, std::uint64_t* out) {
  if (value.is_number_unsigned()) {
    *out = value.get<std::uint64_t>();
    return true;
  }
  if (value.is_number_integer()) {
    const auto signed_value = value.get<std::int64_t>();
    if (signed_value < 0) {
      return false;
    }
    *out = static_cast<std::uint64_t>(signed_value);
    return true;
  }
  if (!value.is_string()) {
    return false;
  }
  const auto& text = value.get_ref<const std::string&>();
  if (text.empty() || text.size() > 20) {
    return false;
  }
  std::uint64_t result = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
    if (result > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
      return false;
    }
    result = result * 10 + digit;
  }
  *out = result;
  return true;
}

std::optional<UtxoEntry> UtxoFromJson(const nlohmann::json& record, std::string* error) {
  if (!record.is_object()) {
    Reject(error, "utxo record is not an object");
    return std::nullopt;
  }
  const nlohmann::json& outpoint =
      FindField(record, "outpoint") ? record.at("outpoint") : record;
  const auto* txid = FindField(outpoint, "transactionId");
  const auto* index = FindField(outpoint, "index");
  if (!txid || !txid->is_string() || !index) {
    Reject(error, "utxo record is missing its outpoint");
    return std::nullopt;
  }
  UtxoEntry entry;
  entry.outpoint.transaction_id = txid->get<std::string>();
  for (auto& c : entry.outpoint.transaction_id) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (entry.outpoint.transaction_id.size() != 64 ||
      !util::IsHexString(entry.outpoint.transaction_id)) {
    Reject(error, "utxo transaction id must be 64 hex characters");
    return std::nullopt;
  }
  std::uint64_t index_value = 0;
  if (!ParseU64Field(*index, &index_value) ||
      index_value > std::numeric_limits<std::uint32_t>::max()) {
    Reject(error, "utxo outpoint index is not a valid u32");
    return std::nullopt;
  }
  entry.outpoint.index = static_cast<std::uint32_t>(index_value);

  const auto* amount = FindField(record, "amount");
  if (!amount || !ParseU64Field(*amount, &entry.amount) || !MoneyRange(entry.amount)) {
    Reject(error, "utxo amount is missing or not an integer sompi value");
    return std::nullopt;
  }

  if (const auto* spk = FindField(record, "scriptPublicKey")) {
    std::string script_hex;
    if (spk->is_string()) {
      script_hex = spk->get<std::string>();
    } else if (spk->is_object()) {
      std::uint64_t version = 0;
      if (const auto* v = FindField(*spk, "version"); v && !ParseU64Field(*v, &version)) {
        Reject(error, "utxo script version is invalid");
        return std::nullopt;
      }
      if (version > std::numeric_limits<std::uint16_t>::max()) {
        Reject(error, "utxo script version is invalid");
        return std::nullopt;
      }
      entry.script_version = static_cast<std::uint16_t>(version);
      if (const auto* s = FindField(*spk, "script"); s && s->is_string()) {
        script_hex = s->get<std::string>();
      }
    }
    if (!util::HexDecode(script_hex, &entry.script_public_key)) {
      Reject(error, "utxo script is not valid hex");
      return std::nullopt;
    }
  }
  if (const auto* address = FindField(record, "address"); address && address->is_string()) {
    entry.address = address->get<std::string>();
  }
  if (const auto* daa = FindField(record, "blockDaaScore")) {
    if (!ParseU64Field(*daa, &entry.block_daa_score)) {
      Reject(error, "utxo blockDaaScore is invalid");
      return std::nullopt;
    }
  }
  if (const auto* coinbase = FindField(record, "isCoinbase"); coinbase && coinbase->is_boolean()) {
    entry.is_coinbase = coinbase->get<bool>();
  }
  return entry;
}

nlohmann::json UtxoToJson(const UtxoEntry& entry) {
  nlohmann::json out;
  out["outpoint"] = {{"transactionId", entry.outpoint.transaction_id},
                     {"index", entry.outpoint.index}};
  // Strings keep 64-bit values exact for JavaScript readers.
  out["amount"] = std::to_string(entry.amount);
  out["scriptPublicKey"] = {{"version", entry.script_version},
                            {"script", util::HexEncode(entry.script_public_key)}};
  out["address"] = entry.address;
  out["blockDaaScore"] = std::to_string(entry.block_daa_score);
  out["isCoinbase"] = entry.is_coinbase;
  return out;
}

}  // namespace kasstamp::primitives
