#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "chain/offline_chain_service.hpp"
#include "config/network.hpp"
#include "crypto/hash.hpp"
#include "payload/artifact_payload.hpp"
#include "payload/chunk_splitter.hpp"
#include "stamping/receipt_validator.hpp"
#include "stamping/reconstructor.hpp"
#include "stamping/stamping_receipt.hpp"
#include "stamping/transaction_batcher.hpp"
#include "util/csprng.hpp"
#include "util/error.hpp"
#include "wallet/key_value_storage.hpp"
#include "wallet/signing_enclave.hpp"

using namespace kasstamp;
using util::ErrorCode;
using util::StampError;

namespace {

constexpr const char* kMnemonic =
    "legal winner thank year wave sausage worth useful legal winner thank yellow";
constexpr const char* kPassword = "stamping password";

template <typename Fn>
bool ThrowsCode(Fn&& fn, ErrorCode code) {
  try {
    fn();
  } catch (const StampError& e) {
    return e.code() == code;
  }
  return false;
}

const config::NetworkConfig& Testnet() { return config::ConfigFor(config::NetworkType::kTestnet10); }

struct Fixture {
  wallet::MemoryStorage storage;
  wallet::SigningEnclave enclave{storage, [] {
                                   wallet::EnclaveOptions options;
                                   options.kdf_params = {1, 64, 1};
                                   return options;
                                 }()};
  chain::OfflineChainService service{[] {
    chain::OfflineChainOptions options;
    options.network_id = Testnet().network_id;
    options.address_prefix = Testnet().address_prefix;
    return options;
  }()};

  Fixture() {
    enclave.StoreMnemonic(kMnemonic, kPassword);
    enclave.Unlock(kPassword);
  }

  void Fund(primitives::Amount amount) {
    service.Fund(enclave.DeriveAddress(Testnet(), {0, 0, true}), amount);
  }

  stamping::TransactionBatcher Batcher(payload::StampingMode mode, std::size_t chunk_size = 20000) {
    stamping::BatcherOptions options;
    options.mode = mode;
    options.preparation.chunk_size = chunk_size;
    options.network = Testnet();
    return stamping::TransactionBatcher(service, service, enclave, options);
  }

  stamping::PayloadLookup Lookup() {
    return [this](const std::string& id) {
      auto bytes = service.GetPayload(id);
      if (!bytes) {
        util::Fail(ErrorCode::kTransactionFailed, "unknown transaction " + id);
      }
      return *bytes;
    };
  }
};

// Forwards to the offline service and keeps the estimate requests it saw.
class RecordingService final : public chain::ChainTransactionService {
 public:
  explicit RecordingService(chain::OfflineChainService& inner) : inner_(inner) {}

  chain::TransactionEstimate Estimate(const chain::TransactionRequest& request) override {
    estimate_requests.push_back(request);
    return inner_.Estimate(request);
  }
  std::vector<std::unique_ptr<chain::PendingTransaction>> Create(
      const chain::TransactionRequest& request) override {
    return inner_.Create(request);
  }
  std::string Submit(chain::PendingTransaction& transaction) override {
    return inner_.Submit(transaction);
  }

  std::vector<chain::TransactionRequest> estimate_requests;

 private:
  chain::OfflineChainService& inner_;
};

stamping::ArtifactInput FileArtifact(const std::string& name, std::vector<std::uint8_t> bytes) {
  stamping::ArtifactInput input;
  input.name = name;
  input.bytes = std::move(bytes);
  return input;
}

}  // namespace

int main() {
  try {
    {
      // Preconditions: an unlocked and funded wallet.
      Fixture f;
      auto batcher = f.Batcher(payload::StampingMode::kPublic);
      const std::vector<stamping::ArtifactInput> artifacts = {stamping::TextArtifact("hi")};
      if (!ThrowsCode([&] { batcher.Commit(artifacts); }, ErrorCode::kNoUtxos)) {
        std::cerr << "unfunded commit did not report kNoUtxos\n";
        return EXIT_FAILURE;
      }
      f.enclave.Lock();
      if (!ThrowsCode([&] { batcher.Commit(artifacts); }, ErrorCode::kLocked)) {
        std::cerr << "commit with a locked enclave did not report kLocked\n";
        return EXIT_FAILURE;
      }
      if (!ThrowsCode(
              [&] {
                stamping::PrepareArtifact(artifacts.front(), payload::StampingMode::kPrivate, {},
                                          &f.enclave);
              },
              ErrorCode::kLocked)) {
        std::cerr << "private preparation with a locked enclave did not report kLocked\n";
        return EXIT_FAILURE;
      }
    }

    {
      // Preparation compresses only when it helps.
      stamping::PreparationOptions options;
      const auto repetitive = stamping::PrepareArtifact(
          stamping::TextArtifact(std::string(5000, 'a')), payload::StampingMode::kPublic, options);
      const auto random = stamping::PrepareArtifact(
          FileArtifact("noise.bin", util::SecureRandomBytes(2000)), payload::StampingMode::kPublic,
          options);
      if (!repetitive.compressed || repetitive.processed_size >= 5000 || random.compressed ||
          repetitive.file_name != stamping::kDefaultTextName ||
          repetitive.payloads.size() != repetitive.chunks.size()) {
        std::cerr << "preparation made the wrong compression decision\n";
        return EXIT_FAILURE;
      }
    }

    {
      // Estimate previews cost per artifact without touching the chain.
      Fixture f;
      auto batcher = f.Batcher(payload::StampingMode::kPublic);
      const std::vector<stamping::ArtifactInput> artifacts = {
          stamping::TextArtifact("short note", "note.txt"),
          FileArtifact("blob.bin", util::SecureRandomBytes(45000))};
      const auto estimation = batcher.Estimate(artifacts);
      if (estimation.artifacts.size() != 2 || estimation.artifacts[0].chunk_count != 1 ||
          estimation.artifacts[1].chunk_count != 3 || estimation.transaction_count != 4 ||
          estimation.total_fees == 0 || !estimation.artifacts[1].within_mass_limit ||
          f.service.transaction_count() != 0) {
        std::cerr << "estimate does not describe the batch\n";
        return EXIT_FAILURE;
      }
      if (estimation.utxo_count != 0) {
        std::cerr << "unfunded estimate claims a funding UTXO\n";
        return EXIT_FAILURE;
      }
      auto oversized = f.Batcher(payload::StampingMode::kPublic, 120000);
      const auto big = oversized.Estimate({FileArtifact("big.bin", util::SecureRandomBytes(110000))});
      if (big.artifacts.front().within_mass_limit) {
        std::cerr << "estimate did not flag a chunk above the mass limit\n";
        return EXIT_FAILURE;
      }
    }

    {
      // Estimates of a funded wallet price the UTXO and change address Commit would use.
      Fixture f;
      f.Fund(3 * primitives::kSompiPerKas);
      f.Fund(7 * primitives::kSompiPerKas);
      RecordingService recording(f.service);
      stamping::BatcherOptions options;
      options.network = Testnet();
      stamping::TransactionBatcher batcher(recording, f.service, f.enclave, options);
      const auto estimation =
          batcher.Estimate({FileArtifact("two.bin", util::SecureRandomBytes(30000))});
      const auto change = f.enclave.DeriveAddress(Testnet(), {0, 0, false});
      if (estimation.utxo_count != 1 || estimation.change_address != change ||
          recording.estimate_requests.size() != 2) {
        std::cerr << "funded estimate did not use the wallet's UTXOs\n";
        return EXIT_FAILURE;
      }
      for (const auto& request : recording.estimate_requests) {
        if (request.entries.size() != 1 ||
            request.entries.front().amount != 7 * primitives::kSompiPerKas ||
            request.change_address != change) {
          std::cerr << "estimate request lacks the funding input or change address\n";
          return EXIT_FAILURE;
        }
      }

      f.enclave.Lock();
      recording.estimate_requests.clear();
      const auto locked = batcher.Estimate({stamping::TextArtifact("still priced")});
      if (locked.utxo_count != 0 || locked.transaction_count != 1 ||
          recording.estimate_requests.size() != 1 ||
          !recording.estimate_requests.front().entries.empty() ||
          !recording.estimate_requests.front().change_address.empty()) {
        std::cerr << "locked estimate should price without wallet inputs\n";
        return EXIT_FAILURE;
      }
    }

    {
      // Public stamping, receipt handling and reconstruction.
      Fixture f;
      f.Fund(20 * primitives::kSompiPerKas);
      auto batcher = f.Batcher(payload::StampingMode::kPublic);
      const auto blob = util::SecureRandomBytes(45000);
      const std::string text(5000, 'z');
      const std::vector<stamping::ArtifactInput> artifacts = {
          stamping::TextArtifact(text, "notes.txt"), FileArtifact("blob.bin", blob)};
      std::size_t last_progress = 0;
      const auto batch = batcher.Commit(artifacts, nullptr,
                                        [&](std::size_t done, std::size_t) { last_progress = done; });
      if (!batch.all_complete() || batch.transaction_ids.size() != 4 || last_progress != 4 ||
          batch.total_fees == 0) {
        std::cerr << "public batch did not complete\n";
        return EXIT_FAILURE;
      }
      const auto& blob_result = batch.artifacts[1];
      if (!blob_result.receipt || blob_result.transaction_ids.size() != 3 ||
          blob_result.receipt->id != blob_result.transaction_ids.front() ||
          blob_result.receipt->hash != crypto::Sha256Hex(blob) ||
          blob_result.receipt->wallet_address != f.enclave.DeriveAddress(Testnet(), {0, 0, true}) ||
          blob_result.receipt->network != "testnet-10") {
        std::cerr << "public receipt does not describe the stamped file\n";
        return EXIT_FAILURE;
      }

      // The receipt lists every chunk with the digest the splitter and the chain carry.
      payload::SplitOptions split;
      split.group_id = blob_result.receipt->group_id;
      const auto expected_chunks = payload::SplitIntoChunks(blob, split);
      const auto& chunk_refs = blob_result.receipt->chunks;
      if (chunk_refs.size() != expected_chunks.size() || chunk_refs.size() != 3) {
        std::cerr << "receipt lists " << chunk_refs.size() << " chunks, expected 3\n";
        return EXIT_FAILURE;
      }
      for (std::size_t i = 0; i < chunk_refs.size(); ++i) {
        const auto on_chain =
            payload::OpenChunkEnvelope(*f.service.GetPayload(blob_result.transaction_ids[i]));
        if (chunk_refs[i].index != i || chunk_refs[i].total != 3 ||
            chunk_refs[i].digest != expected_chunks[i].digest ||
            chunk_refs[i].digest != on_chain.artifact.digest ||
            chunk_refs[i].digest != crypto::Sha256Hex(on_chain.artifact.chunk_data)) {
          std::cerr << "receipt chunk " << i << " does not match the stamped chunk\n";
          return EXIT_FAILURE;
        }
      }

      const auto rebuilt = stamping::Reconstruct(*blob_result.receipt, f.Lookup());
      if (!rebuilt.hash_matches || rebuilt.data != blob || rebuilt.chunks != 3 ||
          rebuilt.file_name != "blob.bin") {
        std::cerr << "public reconstruction failed\n";
        return EXIT_FAILURE;
      }
      const auto text_rebuilt = stamping::Reconstruct(*batch.artifacts[0].receipt, f.Lookup());
      if (!text_rebuilt.decompressed ||
          std::string(text_rebuilt.data.begin(), text_rebuilt.data.end()) != text) {
        std::cerr << "compressed text did not reconstruct\n";
        return EXIT_FAILURE;
      }

      auto wrong_hash = *blob_result.receipt;
      wrong_hash.hash = std::string(64, '0');
      if (stamping::Reconstruct(wrong_hash, f.Lookup()).hash_matches) {
        std::cerr << "hash mismatch was not reported\n";
        return EXIT_FAILURE;
      }
      auto wrong_chunk = *blob_result.receipt;
      wrong_chunk.chunks[1].digest = std::string(64, 'f');
      if (!ThrowsCode([&] { stamping::Reconstruct(wrong_chunk, f.Lookup()); },
                      ErrorCode::kDigestMismatch)) {
        std::cerr << "chunk digest differing from the receipt was not reported\n";
        return EXIT_FAILURE;
      }

      const auto json = stamping::ReceiptToJson(*blob_result.receipt);
      if (json.value("mode", "") != "public" || !json.contains("chunks") ||
          json["chunks"].size() != 3 || json["chunks"][2]["index"] != 2 ||
          json["chunks"][2]["digest"] != chunk_refs[2].digest) {
        std::cerr << "receipt JSON lacks its mode or chunk list\n";
        return EXIT_FAILURE;
      }
      const auto validation = stamping::ValidateReceipt(json);
      if (!validation.valid || !validation.errors.empty()) {
        std::cerr << "generated receipt failed validation\n";
        return EXIT_FAILURE;
      }
      const auto parsed = stamping::ParseReceipt(json.dump(2));
      if (parsed.chunks.size() != 3 || parsed.chunks[1].digest != chunk_refs[1].digest ||
          parsed.chunks[1].total != 3) {
        std::cerr << "receipt chunk list did not round trip\n";
        return EXIT_FAILURE;
      }
      if (parsed.transaction_ids != blob_result.receipt->transaction_ids ||
          parsed.total_cost_sompi != blob_result.receipt->total_cost_sompi ||
          parsed.group_id != blob_result.receipt->group_id || parsed.file_size != blob.size()) {
        std::cerr << "receipt JSON did not round trip\n";
        return EXIT_FAILURE;
      }

      auto hostile = json;
      hostile["id"] = "not-a-transaction";
      hostile["fileName"] = "invoice.pdf.exe";
      const auto flagged = stamping::ValidateReceipt(hostile);
      if (flagged.valid || flagged.warnings.empty()) {
        std::cerr << "hostile receipt was not flagged\n";
        return EXIT_FAILURE;
      }
      if (!ThrowsCode([] { stamping::ParseReceipt("{\"id\": 5}"); }, ErrorCode::kMetadataJson)) {
        std::cerr << "malformed receipt parsed\n";
        return EXIT_FAILURE;
      }

      // Counts and costs must be whole values that fit in 64 bits.
      auto huge_size = json;
      huge_size["fileSize"] = 1e300;
      auto fractional_size = json;
      fractional_size["fileSize"] = 1.5;
      auto huge_cost = json;
      huge_cost.erase("totalCostSompi");
      huge_cost["totalCostKAS"] = 1e300;
      auto bad_chunk = json;
      bad_chunk["chunks"][0]["index"] = 7;
      for (const auto* bad : {&huge_size, &fractional_size, &huge_cost, &bad_chunk}) {
        if (!ThrowsCode([&] { stamping::ReceiptFromJson(*bad); }, ErrorCode::kMetadataJson)) {
          std::cerr << "receipt with an out-of-range number parsed: " << bad->dump() << "\n";
          return EXIT_FAILURE;
        }
      }
      auto whole_float = json;
      whole_float["fileSize"] = 45000.0;
      auto kas_only = json;
      kas_only.erase("totalCostSompi");
      kas_only["totalCostKAS"] = 0.125;
      if (stamping::ReceiptFromJson(whole_float).file_size != 45000 ||
          stamping::ReceiptFromJson(kas_only).total_cost_sompi != 12500000) {
        std::cerr << "whole-valued numbers were not accepted\n";
        return EXIT_FAILURE;
      }
    }

    {
      // Private stamping seals the receipt and the on-chain data.
      Fixture f;
      f.Fund(20 * primitives::kSompiPerKas);
      auto batcher = f.Batcher(payload::StampingMode::kPrivate, 1000);
      const auto secret = util::SecureRandomBytes(2500);
      const auto batch = batcher.Commit({FileArtifact("diary.txt", secret)});
      if (!batch.all_complete() || !batch.artifacts.front().receipt) {
        std::cerr << "private batch did not complete\n";
        return EXIT_FAILURE;
      }
      const auto& receipt = *batch.artifacts.front().receipt;
      if (!receipt.encrypted || receipt.file_name != payload::kRedactedField ||
          !receipt.transaction_ids.empty() || !receipt.encrypted_transaction_ids ||
          !receipt.encrypted_metadata) {
        std::cerr << "private receipt leaks metadata\n";
        return EXIT_FAILURE;
      }
      for (const auto& id : batch.transaction_ids) {
        const auto view = payload::OpenChunkEnvelope(*f.service.GetPayload(id));
        if (view.artifact.file_name != payload::kRedactedField) {
          std::cerr << "private payload carries the file name\n";
          return EXIT_FAILURE;
        }
      }
      if (!stamping::ValidateReceipt(stamping::ReceiptToJson(receipt)).valid) {
        std::cerr << "private receipt failed validation\n";
        return EXIT_FAILURE;
      }

      const auto rebuilt = stamping::Reconstruct(receipt, f.Lookup(), &f.enclave);
      if (!rebuilt.decrypted || !rebuilt.hash_matches || rebuilt.data != secret ||
          rebuilt.file_name != "diary.txt") {
        std::cerr << "private reconstruction failed\n";
        return EXIT_FAILURE;
      }
      if (!ThrowsCode([&] { stamping::Reconstruct(receipt, f.Lookup()); }, ErrorCode::kLocked)) {
        std::cerr << "private reconstruction without an enclave did not report kLocked\n";
        return EXIT_FAILURE;
      }

      // A payload from another stamping is refused.
      auto public_batcher = f.Batcher(payload::StampingMode::kPublic);
      const auto other = public_batcher.Commit({stamping::TextArtifact("other")});
      const std::string foreign_id = other.transaction_ids.front();
      const stamping::PayloadLookup swapped = [&](const std::string&) {
        return *f.service.GetPayload(foreign_id);
      };
      if (!ThrowsCode([&] { stamping::Reconstruct(receipt, swapped, &f.enclave); },
                      ErrorCode::kGroupMismatch)) {
        std::cerr << "foreign payload accepted\n";
        return EXIT_FAILURE;
      }
    }

    {
      // A failing artifact stops the chain; later artifacts are not submitted.
      Fixture f;
      f.Fund(20 * primitives::kSompiPerKas);
      auto batcher = f.Batcher(payload::StampingMode::kPublic, 120000);
      const auto batch = batcher.Commit({stamping::TextArtifact("first", "first.txt"),
                                         FileArtifact("huge.bin", util::SecureRandomBytes(110000)),
                                         stamping::TextArtifact("third", "third.txt")});
      if (batch.all_complete() ||
          batch.artifacts[0].status != stamping::ArtifactStampStatus::kComplete ||
          batch.artifacts[1].status != stamping::ArtifactStampStatus::kFailed ||
          batch.artifacts[2].status != stamping::ArtifactStampStatus::kNotSubmitted ||
          !batch.artifacts[1].error || batch.artifacts[2].receipt ||
          stamping::ArtifactStampStatusName(batch.artifacts[2].status) != "not-submitted") {
        std::cerr << "per-artifact outcomes are wrong after a failure\n";
        return EXIT_FAILURE;
      }

      stamping::CancellationToken cancel;
      cancel.Cancel();
      const auto cancelled = f.Batcher(payload::StampingMode::kPublic)
                                 .Commit({stamping::TextArtifact("late")}, &cancel);
      if (!cancelled.cancelled ||
          cancelled.artifacts.front().status != stamping::ArtifactStampStatus::kNotSubmitted) {
        std::cerr << "cancelled batch submitted transactions\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "stamping_flow_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }

  std::cout << "stamping_flow_tests: OK\n";
  return 0;
}
