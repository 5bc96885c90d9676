#include "stamping/transaction_chain.hpp"

#include "payload/payload_codec.hpp"
#include "util/logging.hpp"

namespace kasstamp::stamping {

ChainedTransactionResult SubmitChainedTransaction(chain::ChainTransactionService& service,
                                                  std::vector<primitives::UtxoEntry> inputs,
                                                  std::span<const std::uint8_t> payload,
                                                  const SigningFunction& sign,
                                                  const ChainOptions& options) {
  if (inputs.empty()) {
    util::Fail(util::ErrorCode::kNoUtxos, "no input available for chained transaction");
  }
  const auto advisory = payload::EstimateMass(payload.size());
  if (!advisory.within_limit) {
    util::Fail(util::ErrorCode::kMassLimit,
               "payload of " + std::to_string(payload.size()) + " bytes has estimated mass " +
                   std::to_string(advisory.total) + ", limit is " +
                   std::to_string(payload::kMaxTransactionMass));
  }

  chain::TransactionRequest request;
  if (options.output_amount > 0) {
    request.outputs.push_back({options.receive_address, options.output_amount});
  }
  request.change_address = options.change_address;
  request.entries = std::move(inputs);
  request.payload.assign(payload.begin(), payload.end());
  request.priority_fee = options.priority_fee;
  request.network_id = options.network_id;

  auto transactions = service.Create(request);
  if (transactions.empty()) {
    util::Fail(util::ErrorCode::kTransactionFailed, "transaction service produced no transaction");
  }
  if (transactions.size() > 1) {
    util::Fail(util::ErrorCode::kTransactionFailed,
               "transaction service split the payload into " +
                   std::to_string(transactions.size()) + " transactions; consolidate UTXOs first");
  }
  auto& pending = *transactions.front();
  if (pending.Mass() > payload::kMaxTransactionMass) {
    util::Fail(util::ErrorCode::kMassLimit,
               "transaction mass " + std::to_string(pending.Mass()) + " exceeds limit " +
                   std::to_string(payload::kMaxTransactionMass));
  }

  sign(pending);
  ChainedTransactionResult result;
  result.transaction_id = service.Submit(pending);
  result.fee = pending.Fee();
  result.mass = pending.Mass();
  result.virtual_utxo = pending.ChangeOutput();
  if (result.virtual_utxo) {
    result.virtual_utxo->outpoint.transaction_id = result.transaction_id;
    result.virtual_utxo->block_daa_score = primitives::kVirtualDaaScore;
  }
  util::LogDebug("chain: submitted " + result.transaction_id + " (mass " +
                 std::to_string(result.mass) + ", fee " + std::to_string(result.fee) + " sompi)");
  return result;
}

ChainRunResult RunTransactionChain(chain::ChainTransactionService& service,
                                   std::vector<primitives::UtxoEntry> initial_inputs,
                                   std::span<const std::vector<std::uint8_t>> payloads,
                                   const SigningFunction& sign, const ChainOptions& options,
                                   const CancellationToken* cancel,
                                   const ChainProgress& progress) {
  ChainRunResult run;
  std::vector<primitives::UtxoEntry> inputs = std::move(initial_inputs);
  for (std::size_t i = 0; i < payloads.size(); ++i) {
    if (cancel && cancel->IsCancelled()) {
      run.cancelled = true;
      util::LogWarn("chain: cancelled after " + std::to_string(i) + " of " +
                    std::to_string(payloads.size()) + " transaction(s)");
      break;
    }
    try {
      auto result = SubmitChainedTransaction(service, inputs, payloads[i], sign, options);
      const bool more = i + 1 < payloads.size();
      if (result.virtual_utxo) {
        inputs = {*result.virtual_utxo};
      }
      const bool chain_broken = more && !result.virtual_utxo;
      run.submitted.push_back(std::move(result));
      if (chain_broken) {
        run.failure = ChainFailure{i + 1, util::ErrorCode::kNoChangeOutput,
                                   "transaction left no change output to chain from"};
      }
    } catch (const util::StampError& e) {
      run.failure = ChainFailure{i, e.code(), e.what()};
    } catch (const std::exception& e) {
      run.failure = ChainFailure{i, util::ErrorCode::kTransactionFailed, e.what()};
    }
    if (run.failure) {
      util::LogError("chain: transaction " + std::to_string(run.failure->payload_index + 1) +
                     " of " + std::to_string(payloads.size()) + " failed: " +
                     run.failure->message);
      break;
    }
    if (progress) {
      progress(run.submitted.size(), payloads.size());
    }
  }
  return run;
}

}  // namespace kasstamp::stamping
