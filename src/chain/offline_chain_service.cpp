#include "chain/offline_chain_service.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <system_error>

#include "crypto/address.hpp"
#include "crypto/hash.hpp"
#include "crypto/schnorr.hpp"
#include "payload/payload_codec.hpp"
#include "util/error.hpp"
#include "util/file_io.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"

namespace kasstamp::chain {

namespace {

constexpr std::uint8_t kSigHashAll = 0x01;
constexpr std::size_t kSignatureScriptSize = 66;  // push(65) || sig(64) || sighash
constexpr std::size_t kMaxJournalBytes = 1024u * 1024u * 1024u;

std::string OutpointKey(const primitives::Outpoint& outpoint) {
  return outpoint.transaction_id + ":" + std::to_string(outpoint.index);
}

std::vector<std::uint8_t> ScriptForAddress(const std::string& address,
                                           const std::string& expected_prefix) {
  const auto decoded = crypto::DecodeAddress(address);
  if (!decoded) {
    util::Fail(util::ErrorCode::kInvalidArgument, "invalid address '" + address + "'");
  }
  if (decoded->prefix != expected_prefix) {
    util::Fail(util::ErrorCode::kInvalidArgument,
               "address '" + address + "' does not belong to network prefix '" +
                   expected_prefix + "'");
  }
  return crypto::PayToAddressScript(*decoded);
}

// Inverse of PayToAddressScript for x-only key scripts.
std::optional<std::array<std::uint8_t, 32>> KeyFromScript(const std::vector<std::uint8_t>& script) {
  if (script.size() != 34 || script[0] != 0x20 || script[33] != 0xac) {
    return std::nullopt;
  }
  std::array<std::uint8_t, 32> key{};
  std::copy(script.begin() + 1, script.begin() + 33, key.begin());
  return key;
}

std::string AddressForScript(const std::vector<std::uint8_t>& script, const std::string& prefix) {
  const auto key = KeyFromScript(script);
  if (!key) {
    return {};
  }
  return crypto::AddressFromXOnlyKey(prefix, *key);
}

struct BuiltTransaction {
  primitives::Transaction tx;
  primitives::Amount fee{0};
  std::uint64_t mass{0};
  std::optional<std::uint32_t> change_index;
  primitives::Amount change_amount{0};
  primitives::Amount total_out{0};
};

// Builds the unsigned transaction and settles fee and change. Placeholder
// signature scripts are used while measuring so the mass is that of the
// signed transaction.
BuiltTransaction BuildTransaction(const TransactionRequest& request,
                                  const OfflineChainOptions& options, bool require_funds) {
  BuiltTransaction built;
  primitives::Amount total_in = 0;
  for (const auto& entry : request.entries) {
    primitives::TxInput input;
    input.previous_outpoint = entry.outpoint;
    input.signature_script.assign(kSignatureScriptSize, 0);
    built.tx.inputs.push_back(std::move(input));
    if (!primitives::CheckedAdd(total_in, entry.amount, &total_in)) {
      util::Fail(util::ErrorCode::kInvalidArgument, "input amounts out of range");
    }
  }
  if (built.tx.inputs.empty()) {
    if (require_funds) {
      util::Fail(util::ErrorCode::kNoUtxos, "transaction request has no inputs");
    }
    primitives::TxInput placeholder;
    placeholder.previous_outpoint.transaction_id = std::string(64, '0');
    placeholder.signature_script.assign(kSignatureScriptSize, 0);
    built.tx.inputs.push_back(std::move(placeholder));
  }
  for (const auto& output : request.outputs) {
    primitives::TxOutput tx_output;
    tx_output.value = output.amount;
    tx_output.script_public_key = ScriptForAddress(output.address, options.address_prefix);
    built.tx.outputs.push_back(std::move(tx_output));
    if (!primitives::CheckedAdd(built.total_out, output.amount, &built.total_out)) {
      util::Fail(util::ErrorCode::kInvalidArgument, "output amounts out of range");
    }
  }
  primitives::TxOutput change;
  if (!request.change_address.empty()) {
    change.script_public_key = ScriptForAddress(request.change_address, options.address_prefix);
  } else {
    change.script_public_key.assign(34, 0);
  }
  built.tx.outputs.push_back(change);
  built.change_index = static_cast<std::uint32_t>(built.tx.outputs.size() - 1);
  built.tx.payload = request.payload;

  built.mass = primitives::ComputeTransactionMass(built.tx);
  built.fee = built.mass * options.fee_rate + request.priority_fee;

  primitives::Amount needed = 0;
  if (!primitives::CheckedAdd(built.total_out, built.fee, &needed)) {
    util::Fail(util::ErrorCode::kInvalidArgument, "fee out of range");
  }
  if (require_funds) {
    if (total_in < needed) {
      util::Fail(util::ErrorCode::kInsufficientFunds,
                 "insufficient funds: need " + primitives::FormatKas(needed) + " KAS, have " +
                     primitives::FormatKas(total_in) + " KAS");
    }
    built.change_amount = total_in - needed;
    if (built.change_amount > 0 && request.change_address.empty()) {
      util::Fail(util::ErrorCode::kInvalidArgument,
                 "transaction returns change but no change address was given");
    }
  }
  if (require_funds && built.change_amount == 0) {
    built.tx.outputs.pop_back();
    built.change_index.reset();
    built.mass = primitives::ComputeTransactionMass(built.tx);
  } else {
    built.tx.outputs.back().value = built.change_amount;
  }
  for (auto& input : built.tx.inputs) {
    input.signature_script.clear();
  }
  return built;
}

class OfflinePendingTransaction final : public PendingTransaction {
 public:
  OfflinePendingTransaction(BuiltTransaction built, std::vector<primitives::UtxoEntry> entries,
                            std::string change_address, std::string prefix)
      : built_(std::move(built)),
        entries_(std::move(entries)),
        change_address_(std::move(change_address)),
        prefix_(std::move(prefix)),
        id_(primitives::ComputeTransactionId(built_.tx)) {}

  std::string Id() const override { return id_; }

  std::vector<std::string> Addresses() const override {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& entry : entries_) {
      std::string address = entry.address;
      if (address.empty()) {
        address = AddressForScript(entry.script_public_key, prefix_);
      }
      if (!address.empty() && seen.insert(address).second) {
        out.push_back(address);
      }
    }
    return out;
  }

  void Sign(std::span<const SigningKey> keys) override {
    std::vector<std::vector<std::uint8_t>> scripts(entries_.size());
    for (std::size_t i = 0; i < entries_.size(); ++i) {
      const auto expected = KeyFromScript(entries_[i].script_public_key);
      const SigningKey* match = nullptr;
      for (const auto& key : keys) {
        if (expected && key.x_only_public_key() == *expected) {
          match = &key;
          break;
        }
      }
      if (!match) {
        util::Fail(util::ErrorCode::kTransactionFailed,
                   "missing signature for input " + std::to_string(i) + " (" +
                       entries_[i].address + ")");
      }
      const auto sighash = primitives::SignatureHash(built_.tx, i);
      const auto signature = crypto::SchnorrSign(match->secret(), sighash);
      auto& script = scripts[i];
      script.reserve(kSignatureScriptSize);
      script.push_back(static_cast<std::uint8_t>(signature.size() + 1));
      script.insert(script.end(), signature.begin(), signature.end());
      script.push_back(kSigHashAll);
    }
    for (std::size_t i = 0; i < scripts.size(); ++i) {
      built_.tx.inputs[i].signature_script = std::move(scripts[i]);
    }
    signed_ = true;
  }

  bool IsSigned() const override { return signed_; }
  std::uint64_t Mass() const override { return built_.mass; }
  primitives::Amount Fee() const override { return built_.fee; }
  std::span<const std::uint8_t> Payload() const override { return built_.tx.payload; }

  std::optional<primitives::UtxoEntry> ChangeOutput() const override {
    if (!built_.change_index) {
      return std::nullopt;
    }
    const auto& output = built_.tx.outputs[*built_.change_index];
    primitives::UtxoEntry entry;
    entry.outpoint = {id_, *built_.change_index};
    entry.amount = output.value;
    entry.script_version = output.script_version;
    entry.script_public_key = output.script_public_key;
    entry.address = change_address_;
    entry.block_daa_score = primitives::kVirtualDaaScore;
    return entry;
  }

  const primitives::Transaction& transaction() const noexcept { return built_.tx; }
  const std::vector<primitives::UtxoEntry>& entries() const noexcept { return entries_; }

 private:
  BuiltTransaction built_;
  std::vector<primitives::UtxoEntry> entries_;
  std::string change_address_;
  std::string prefix_;
  std::string id_;
  bool signed_{false};
};

}  // namespace

OfflineChainService::OfflineChainService(OfflineChainOptions options)
    : options_(std::move(options)) {}

void OfflineChainService::Load() {
  if (!options_.journal_path) {
    return;
  }
  std::error_code ec;
  if (!std::filesystem::exists(*options_.journal_path, ec)) {
    return;
  }
  std::string text;
  std::string error;
  if (!util::ReadFileText(*options_.journal_path, kMaxJournalBytes, &text, &error)) {
    util::Fail(util::ErrorCode::kStorageFailure, "failed to read journal: " + error);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t line_no = 0;
  std::size_t start = 0;
  while (start < text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    const std::string line = text.substr(start, end - start);
    start = end + 1;
    ++line_no;
    if (line.empty()) {
      continue;
    }
    const auto record = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
    const auto type = record.is_object() ? record.value("type", std::string()) : std::string();
    if (type == "fund") {
      std::string utxo_error;
      auto entry = primitives::UtxoFromJson(record.value("utxo", nlohmann::json()), &utxo_error);
      if (!entry) {
        util::Fail(util::ErrorCode::kStorageFailure,
                   "journal line " + std::to_string(line_no) + ": " + utxo_error);
      }
      AddUtxo(std::move(*entry));
      ++fund_counter_;
    } else if (type == "tx") {
      std::string tx_error;
      const auto tx = primitives::TransactionFromJson(record.value("transaction", nlohmann::json()),
                                                      &tx_error);
      if (!tx) {
        util::Fail(util::ErrorCode::kStorageFailure,
                   "journal line " + std::to_string(line_no) + ": " + tx_error);
      }
      ApplyTransaction(primitives::ComputeTransactionId(*tx), *tx);
    } else {
      util::Fail(util::ErrorCode::kStorageFailure,
                 "journal line " + std::to_string(line_no) + " is not a known record");
    }
  }
  util::LogDebug("offline chain: replayed " + std::to_string(line_no) + " journal record(s), " +
                 std::to_string(utxos_.size()) + " unspent output(s)");
}

void OfflineChainService::AppendJournal(const nlohmann::json& record) {
  if (!options_.journal_path) {
    return;
  }
  std::error_code ec;
  const auto parent = options_.journal_path->parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
  }
  std::ofstream out(*options_.journal_path, std::ios::app | std::ios::binary);
  out << record.dump() << '\n';
  out.flush();
  if (!out.good()) {
    util::Fail(util::ErrorCode::kStorageFailure,
               "failed to append to journal " + options_.journal_path->string());
  }
}

void OfflineChainService::AddUtxo(primitives::UtxoEntry entry) {
  if (entry.address.empty()) {
    entry.address = AddressForScript(entry.script_public_key, options_.address_prefix);
  }
  utxos_[OutpointKey(entry.outpoint)] = std::move(entry);
}

void OfflineChainService::ApplyTransaction(const std::string& id,
                                           const primitives::Transaction& tx) {
  for (const auto& input : tx.inputs) {
    utxos_.erase(OutpointKey(input.previous_outpoint));
  }
  ++daa_score_;
  for (std::size_t i = 0; i < tx.outputs.size(); ++i) {
    primitives::UtxoEntry entry;
    entry.outpoint = {id, static_cast<std::uint32_t>(i)};
    entry.amount = tx.outputs[i].value;
    entry.script_version = tx.outputs[i].script_version;
    entry.script_public_key = tx.outputs[i].script_public_key;
    entry.block_daa_score = daa_score_;
    AddUtxo(std::move(entry));
  }
  transactions_[id] = tx;
}

primitives::UtxoEntry OfflineChainService::Fund(const std::string& address,
                                                primitives::Amount amount) {
  if (amount == 0 || !primitives::MoneyRange(amount)) {
    util::Fail(util::ErrorCode::kInvalidArgument, "funding amount out of range");
  }
  const auto script = ScriptForAddress(address, options_.address_prefix);
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string seed = "fund:" + std::to_string(fund_counter_) + ":" + address + ":" +
                           std::to_string(amount);
  primitives::UtxoEntry entry;
  entry.outpoint.transaction_id = crypto::Sha256Hex(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(seed.data()), seed.size()));
  entry.outpoint.index = 0;
  entry.amount = amount;
  entry.script_public_key = script;
  entry.address = address;
  entry.block_daa_score = ++daa_score_;
  AppendJournal({{"type", "fund"}, {"utxo", primitives::UtxoToJson(entry)}});
  ++fund_counter_;
  AddUtxo(entry);
  util::LogInfo("offline chain: funded " + address + " with " + primitives::FormatKas(amount) +
                " KAS");
  return entry;
}

TransactionEstimate OfflineChainService::Estimate(const TransactionRequest& request) {
  const auto built = BuildTransaction(request, options_, /*require_funds=*/false);
  TransactionEstimate estimate;
  estimate.transaction_count = 1;
  estimate.fees = built.fee;
  estimate.mass = built.mass;
  estimate.utxo_count = std::max<std::size_t>(request.entries.size(), 1);
  estimate.final_amount = built.total_out;
  return estimate;
}

std::vector<std::unique_ptr<PendingTransaction>> OfflineChainService::Create(
    const TransactionRequest& request) {
  if (!request.network_id.empty() && request.network_id != options_.network_id) {
    util::Fail(util::ErrorCode::kInvalidArgument,
               "request targets network '" + request.network_id + "' but service runs '" +
                   options_.network_id + "'");
  }
  auto built = BuildTransaction(request, options_, /*require_funds=*/true);
  std::vector<std::unique_ptr<PendingTransaction>> out;
  out.push_back(std::make_unique<OfflinePendingTransaction>(
      std::move(built), request.entries, request.change_address, options_.address_prefix));
  return out;
}

std::string OfflineChainService::Submit(PendingTransaction& transaction) {
  auto* pending = dynamic_cast<OfflinePendingTransaction*>(&transaction);
  if (!pending) {
    util::Fail(util::ErrorCode::kInvalidArgument,
               "transaction was not created by the offline chain service");
  }
  if (!pending->IsSigned()) {
    util::Fail(util::ErrorCode::kTransactionFailed, "transaction " + pending->Id() + " is not signed");
  }
  const auto& tx = pending->transaction();
  if (pending->Mass() > payload::kMaxTransactionMass) {
    util::Fail(util::ErrorCode::kMassLimit,
               "transaction mass " + std::to_string(pending->Mass()) + " exceeds limit " +
                   std::to_string(payload::kMaxTransactionMass));
  }
  std::lock_guard<std::mutex> lock(mutex_);
  const auto id = pending->Id();
  if (transactions_.count(id) != 0) {
    util::Fail(util::ErrorCode::kTransactionFailed, "transaction " + id + " already accepted");
  }
  for (std::size_t i = 0; i < tx.inputs.size(); ++i) {
    const auto& input = tx.inputs[i];
    const auto it = utxos_.find(OutpointKey(input.previous_outpoint));
    if (it == utxos_.end()) {
      util::Fail(util::ErrorCode::kTransactionFailed,
                 "input " + OutpointKey(input.previous_outpoint) + " is missing or already spent");
    }
    const auto key = KeyFromScript(it->second.script_public_key);
    const auto& script = input.signature_script;
    if (!key || script.size() != kSignatureScriptSize || script[0] != 65 ||
        script.back() != kSigHashAll ||
        !crypto::SchnorrVerify(*key, primitives::SignatureHash(tx, i),
                               std::span<const std::uint8_t>(script.data() + 1, 64))) {
      util::Fail(util::ErrorCode::kTransactionFailed,
                 "signature verification failed for input " + std::to_string(i));
    }
  }
  AppendJournal({{"type", "tx"}, {"id", id}, {"transaction", primitives::TransactionToJson(tx)}});
  ApplyTransaction(id, tx);
  util::LogDebug("offline chain: accepted " + id + " (mass " + std::to_string(pending->Mass()) +
                 ", fee " + std::to_string(pending->Fee()) + " sompi)");
  return id;
}

std::vector<primitives::UtxoEntry> OfflineChainService::GetUtxos(
    const std::vector<std::string>& addresses) {
  const std::set<std::string> wanted(addresses.begin(), addresses.end());
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<primitives::UtxoEntry> out;
  for (const auto& [key, entry] : utxos_) {
    if (wanted.count(entry.address) != 0) {
      out.push_back(entry);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.amount > b.amount; });
  return out;
}

std::optional<std::vector<std::uint8_t>> OfflineChainService::GetPayload(
    const std::string& transaction_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = transactions_.find(transaction_id);
  if (it == transactions_.end()) {
    return std::nullopt;
  }
  return it->second.payload;
}

std::optional<primitives::Transaction> OfflineChainService::GetTransaction(
    const std::string& transaction_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = transactions_.find(transaction_id);
  if (it == transactions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t OfflineChainService::transaction_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return transactions_.size();
}

std::size_t OfflineChainService::utxo_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return utxos_.size();
}

}  // namespace kasstamp::chain
