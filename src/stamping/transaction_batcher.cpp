#include "stamping/transaction_batcher.hpp"

#include <algorithm>

#include "payload/payload_codec.hpp"
#include "util/error.hpp"
#include "util/logging.hpp"
#include "wallet/signing_enclave.hpp"

namespace kasstamp::stamping {

namespace {

struct PreparedSlot {
  std::size_t artifact_index{0};
  std::optional<PreparedArtifact> prepared;
  std::size_t first_payload{0};
};

}  // namespace

std::string_view ArtifactStampStatusName(ArtifactStampStatus status) {
  switch (status) {
    case ArtifactStampStatus::kComplete:
      return "complete";
    case ArtifactStampStatus::kPartial:
      return "partial";
    case ArtifactStampStatus::kNotSubmitted:
      return "not-submitted";
    case ArtifactStampStatus::kFailed:
      return "failed";
  }
  return "failed";
}

bool BatchResult::all_complete() const noexcept {
  return std::all_of(artifacts.begin(), artifacts.end(), [](const ArtifactStampResult& r) {
    return r.status == ArtifactStampStatus::kComplete;
  });
}

TransactionBatcher::TransactionBatcher(chain::ChainTransactionService& service,
                                       chain::UtxoProvider& utxos,
                                       wallet::SigningEnclave& enclave, BatcherOptions options)
    : service_(service), utxos_(utxos), enclave_(enclave), options_(std::move(options)) {}

StampingEstimation TransactionBatcher::Estimate(const std::vector<ArtifactInput>& artifacts) {
  StampingEstimation estimation;
  // Price against the input Commit would spend. A locked wallet cannot name
  // its addresses, so its requests carry no inputs and no change address.
  std::vector<primitives::UtxoEntry> funding;
  std::string change_address;
  if (!enclave_.IsLocked()) {
    const auto& network = options_.network;
    const std::uint32_t account = options_.account_index;
    const auto receive_address = enclave_.DeriveAddress(network, {account, 0, true});
    change_address = enclave_.DeriveAddress(network, {account, 0, false});
    const auto available = utxos_.GetUtxos({receive_address, change_address});
    const auto largest = std::max_element(
        available.begin(), available.end(),
        [](const primitives::UtxoEntry& a, const primitives::UtxoEntry& b) { return a.amount < b.amount; });
    if (largest != available.end()) {
      funding.push_back(*largest);
    } else {
      util::LogWarn("estimate: no UTXOs for " + receive_address + "; pricing without inputs");
    }
  }
  estimation.utxo_count = funding.size();
  estimation.change_address = change_address;
  for (const auto& artifact : artifacts) {
    ArtifactEstimate estimate;
    estimate.name = artifact.name;
    try {
      const auto prepared =
          PrepareArtifact(artifact, options_.mode, options_.preparation, &enclave_);
      estimate.name = prepared.file_name;
      estimate.chunk_count = prepared.chunks.size();
      for (const auto& bytes : prepared.payloads) {
        chain::TransactionRequest request;
        request.payload = bytes;
        request.entries = funding;
        request.change_address = change_address;
        request.priority_fee = options_.priority_fee;
        request.network_id = options_.network.network_id;
        const auto tx = service_.Estimate(request);
        estimate.transaction_count += tx.transaction_count;
        estimate.total_fees += tx.fees;
        estimate.total_mass += tx.mass;
        estimate.payload_bytes += bytes.size();
        if (tx.mass > payload::kMaxTransactionMass ||
            !payload::EstimateMass(bytes.size()).within_limit) {
          estimate.within_mass_limit = false;
        }
      }
    } catch (const util::StampError& e) {
      estimate.error = e.what();
      util::LogWarn("estimate: '" + artifact.name + "' failed: " + e.what());
    }
    estimation.chunk_count += estimate.chunk_count;
    estimation.transaction_count += estimate.transaction_count;
    estimation.total_fees += estimate.total_fees;
    estimation.total_mass += estimate.total_mass;
    estimation.payload_bytes += estimate.payload_bytes;
    estimation.artifacts.push_back(std::move(estimate));
  }
  return estimation;
}

BatchResult TransactionBatcher::Commit(const std::vector<ArtifactInput>& artifacts,
                                       const CancellationToken* cancel,
                                       const ChainProgress& progress) {
  if (enclave_.IsLocked()) {
    util::Fail(util::ErrorCode::kLocked, "signing enclave is locked; unlock the wallet first");
  }
  const auto& network = options_.network;
  const std::uint32_t account = options_.account_index;
  const auto receive_address = enclave_.DeriveAddress(network, {account, 0, true});
  const auto change_address = enclave_.DeriveAddress(network, {account, 0, false});

  BatchResult batch;
  batch.artifacts.resize(artifacts.size());
  std::vector<PreparedSlot> slots;
  std::vector<std::vector<std::uint8_t>> payloads;
  for (std::size_t i = 0; i < artifacts.size(); ++i) {
    auto& result = batch.artifacts[i];
    result.name = artifacts[i].name;
    try {
      auto prepared = PrepareArtifact(artifacts[i], options_.mode, options_.preparation, &enclave_);
      result.name = prepared.file_name;
      PreparedSlot slot;
      slot.artifact_index = i;
      slot.first_payload = payloads.size();
      for (auto& bytes : prepared.payloads) {
        payloads.push_back(std::move(bytes));
      }
      prepared.payloads.clear();
      slot.prepared = std::move(prepared);
      slots.push_back(std::move(slot));
    } catch (const util::StampError& e) {
      result.status = ArtifactStampStatus::kFailed;
      result.error = e.what();
      util::LogError("stamp: preparing '" + result.name + "' failed: " + e.what());
    }
  }
  if (payloads.empty()) {
    return batch;
  }

  auto available = utxos_.GetUtxos({receive_address, change_address});
  if (available.empty()) {
    util::Fail(util::ErrorCode::kNoUtxos,
               "no UTXOs available for " + receive_address + "; fund the wallet first");
  }
  const auto largest = std::max_element(
      available.begin(), available.end(),
      [](const primitives::UtxoEntry& a, const primitives::UtxoEntry& b) { return a.amount < b.amount; });
  util::LogInfo("stamp: chaining " + std::to_string(payloads.size()) + " transaction(s) from " +
                largest->outpoint.transaction_id + ":" + std::to_string(largest->outpoint.index) +
                " (" + primitives::FormatKas(largest->amount) + " KAS)");

  ChainOptions chain_options;
  chain_options.change_address = change_address;
  chain_options.receive_address = receive_address;
  chain_options.priority_fee = options_.priority_fee;
  chain_options.network_id = network.network_id;
  const SigningFunction sign = [this, &network, account](chain::PendingTransaction& tx) {
    enclave_.SignWithAutoDiscovery(tx, network, account);
  };
  const auto run = RunTransactionChain(service_, {*largest}, payloads, sign, chain_options,
                                       cancel, progress);
  batch.cancelled = run.cancelled;

  for (const auto& slot : slots) {
    auto& result = batch.artifacts[slot.artifact_index];
    const auto& prepared = *slot.prepared;
    const std::size_t count = prepared.chunks.size();
    const std::size_t end = slot.first_payload + count;
    for (std::size_t p = slot.first_payload; p < end && p < run.submitted.size(); ++p) {
      result.transaction_ids.push_back(run.submitted[p].transaction_id);
      result.fees += run.submitted[p].fee;
    }
    const std::size_t done = result.transaction_ids.size();
    const bool failed_here = run.failure && run.failure->payload_index >= slot.first_payload &&
                             run.failure->payload_index < end;
    if (done == count) {
      result.status = ArtifactStampStatus::kComplete;
    } else if (done > 0) {
      result.status = ArtifactStampStatus::kPartial;
    } else {
      result.status = failed_here ? ArtifactStampStatus::kFailed : ArtifactStampStatus::kNotSubmitted;
    }
    if (failed_here) {
      result.error = run.failure->message;
    } else if (result.status != ArtifactStampStatus::kComplete) {
      result.error = run.cancelled ? "cancelled before submission" : "not submitted after an earlier failure";
    }
    batch.total_fees += result.fees;
    batch.transaction_ids.insert(batch.transaction_ids.end(), result.transaction_ids.begin(),
                                 result.transaction_ids.end());

    if (result.status != ArtifactStampStatus::kComplete) {
      continue;
    }
    StampingReceipt receipt;
    receipt.id = result.transaction_ids.front();
    receipt.timestamp = prepared.timestamp;
    receipt.file_name = prepared.file_name;
    receipt.file_size = prepared.file_size;
    receipt.hash = prepared.original_digest;
    receipt.mode = prepared.mode;
    receipt.encrypted = prepared.encrypted;
    receipt.compressed = prepared.compressed;
    receipt.group_id = prepared.group_id;
    receipt.transaction_ids = result.transaction_ids;
    receipt.chunks.reserve(count);
    for (const auto& chunk : prepared.chunks) {
      receipt.chunks.push_back({chunk.index, chunk.total, chunk.digest});
    }
    receipt.chunk_count = count;
    receipt.total_cost_sompi = result.fees;
    receipt.network = network.network_id;
    receipt.wallet_address = receive_address;
    if (prepared.mode == payload::StampingMode::kPrivate) {
      try {
        SealPrivateReceipt(receipt, enclave_);
      } catch (const util::StampError& e) {
        // The artifact is on chain; only the receipt could not be sealed.
        result.error = std::string("receipt encryption failed: ") + e.what();
        util::LogError("stamp: sealing receipt of '" + result.name + "' failed: " + e.what());
        continue;
      }
    }
    result.receipt = std::move(receipt);
  }
  util::LogInfo("stamp: " + std::to_string(run.submitted.size()) + " of " +
                std::to_string(payloads.size()) + " transaction(s) submitted, fees " +
                primitives::FormatKas(batch.total_fees) + " KAS");
  return batch;
}

}  // namespace kasstamp::stamping
