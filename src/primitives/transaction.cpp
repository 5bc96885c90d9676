#include "primitives/transaction.hpp"

#include "crypto/hash.hpp"
#include "util/hex.hpp"

namespace kasstamp::primitives {

namespace {

void WriteBytes(std::vector<std::uint8_t>* out, const std::vector<std::uint8_t>& bytes) {
  WriteUint64(out, bytes.size());
  out->insert(out->end(), bytes.begin(), bytes.end());
}

void WriteOutpoint(std::vector<std::uint8_t>* out, const Outpoint& outpoint) {
  std::vector<std::uint8_t> txid;
  if (!util::HexDecode(outpoint.transaction_id, &txid)) {
    txid.clear();
  }
  txid.resize(32, 0);
  out->insert(out->end(), txid.begin(), txid.end());
  WriteUint32(out, outpoint.index);
}

bool Reject(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
  return false;
}

bool ReadHexField(const nlohmann::json& object, const char* key,
                  std::vector<std::uint8_t>* out, std::string* error) {
  const auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return Reject(error, std::string("missing hex field '") + key + "'");
  }
  if (!util::HexDecode(it->get<std::string>(), out)) {
    return Reject(error, std::string("field '") + key + "' is not valid hex");
  }
  return true;
}

bool ReadU64(const nlohmann::json& object, const char* key, std::uint64_t* out,
             std::string* error) {
  const auto it = object.find(key);
  if (it == object.end() || !ParseU64Field(*it, out)) {
    return Reject(error, std::string("missing or invalid numeric field '") + key + "'");
  }
  return true;
}

}  // namespace

void WriteUint16(std::vector<std::uint8_t>* out, std::uint16_t value) {
  out->push_back(static_cast<std::uint8_t>(value & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
}

void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    out->push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
  }
}

void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out->push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
  }
}

void SerializeTransaction(const Transaction& tx, std::vector<std::uint8_t>* out,
                          bool include_signatures) {
  WriteUint16(out, tx.version);
  WriteUint64(out, tx.inputs.size());
  for (const auto& in : tx.inputs) {
    WriteOutpoint(out, in.previous_outpoint);
    if (include_signatures) {
      WriteBytes(out, in.signature_script);
    } else {
      WriteUint64(out, 0);
    }
    WriteUint64(out, in.sequence);
    out->push_back(in.sig_op_count);
  }
  WriteUint64(out, tx.outputs.size());
  for (const auto& output : tx.outputs) {
    WriteUint64(out, output.value);
    WriteUint16(out, output.script_version);
    WriteBytes(out, output.script_public_key);
  }
  WriteUint64(out, tx.lock_time);
  WriteBytes(out, tx.payload);
}

std::string ComputeTransactionId(const Transaction& tx) {
  std::vector<std::uint8_t> buffer;
  SerializeTransaction(tx, &buffer, /*include_signatures=*/false);
  return crypto::Sha256Hex(buffer);
}

std::vector<std::uint8_t> SignatureHash(const Transaction& tx, std::size_t input_index) {
  std::vector<std::uint8_t> buffer;
  SerializeTransaction(tx, &buffer, /*include_signatures=*/false);
  WriteUint64(&buffer, input_index);
  const auto digest = crypto::Sha256(buffer);
  return std::vector<std::uint8_t>(digest.begin(), digest.end());
}

std::uint64_t ComputeTransactionMass(const Transaction& tx) {
  std::vector<std::uint8_t> buffer;
  SerializeTransaction(tx, &buffer, /*include_signatures=*/true);
  std::uint64_t mass = buffer.size() * kMassPerTxByte;
  for (const auto& output : tx.outputs) {
    mass += (2 + output.script_public_key.size()) * kMassPerScriptPubKeyByte;
  }
  for (const auto& in : tx.inputs) {
    mass += static_cast<std::uint64_t>(in.sig_op_count) * kMassPerSigOp;
  }
  return mass;
}

nlohmann::json TransactionToJson(const Transaction& tx) {
  nlohmann::json inputs = nlohmann::json::array();
  for (const auto& in : tx.inputs) {
    inputs.push_back({
        {"transactionId", in.previous_outpoint.transaction_id},
        {"index", in.previous_outpoint.index},
        {"signatureScript", util::HexEncode(in.signature_script)},
        {"sequence", std::to_string(in.sequence)},
        {"sigOpCount", in.sig_op_count},
    });
  }
  nlohmann::json outputs = nlohmann::json::array();
  for (const auto& output : tx.outputs) {
    outputs.push_back({
        {"value", std::to_string(output.value)},
        {"scriptVersion", output.script_version},
        {"scriptPublicKey", util::HexEncode(output.script_public_key)},
    });
  }
  return {
      {"version", tx.version},
      {"inputs", inputs},
      {"outputs", outputs},
      {"lockTime", std::to_string(tx.lock_time)},
      {"payload", util::HexEncode(tx.payload)},
  };
}

std::optional<Transaction> TransactionFromJson(const nlohmann::json& value, std::string* error) {
  if (!value.is_object()) {
    Reject(error, "transaction record must be an object");
    return std::nullopt;
  }
  Transaction tx;
  std::uint64_t number = 0;
  if (!ReadU64(value, "version", &number, error) || number > 0xFFFF) {
    return std::nullopt;
  }
  tx.version = static_cast<std::uint16_t>(number);
  if (!ReadU64(value, "lockTime", &tx.lock_time, error) ||
      !ReadHexField(value, "payload", &tx.payload, error)) {
    return std::nullopt;
  }
  const auto inputs = value.find("inputs");
  const auto outputs = value.find("outputs");
  if (inputs == value.end() || !inputs->is_array() || outputs == value.end() ||
      !outputs->is_array()) {
    Reject(error, "transaction record needs inputs and outputs arrays");
    return std::nullopt;
  }
  for (const auto& record : *inputs) {
    TxInput in;
    const auto txid = record.find("transactionId");
    if (txid == record.end() || !txid->is_string()) {
      Reject(error, "input is missing transactionId");
      return std::nullopt;
    }
    in.previous_outpoint.transaction_id = txid->get<std::string>();
    if (!ReadU64(record, "index", &number, error) || number > 0xFFFFFFFFu) {
      return std::nullopt;
    }
    in.previous_outpoint.index = static_cast<std::uint32_t>(number);
    if (!ReadHexField(record, "signatureScript", &in.signature_script, error) ||
        !ReadU64(record, "sequence", &in.sequence, error) ||
        !ReadU64(record, "sigOpCount", &number, error) || number > 0xFF) {
      return std::nullopt;
    }
    in.sig_op_count = static_cast<std::uint8_t>(number);
    tx.inputs.push_back(std::move(in));
  }
  for (const auto& record : *outputs) {
    TxOutput output;
    if (!ReadU64(record, "value", &output.value, error) ||
        !ReadU64(record, "scriptVersion", &number, error) || number > 0xFFFF ||
        !ReadHexField(record, "scriptPublicKey", &output.script_public_key, error)) {
      return std::nullopt;
    }
    output.script_version = static_cast<std::uint16_t>(number);
    tx.outputs.push_back(std::move(output));
  }
  return tx;
}

}  // namespace kasstamp::primitives
