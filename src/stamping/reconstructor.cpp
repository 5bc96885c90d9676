#include "stamping/reconstructor.hpp"

#include <algorithm>

#include "crypto/hash.hpp"
#include "payload/artifact_payload.hpp"
#include "payload/chunk_splitter.hpp"
#include "util/error.hpp"
#include "util/gzip.hpp"
#include "util/logging.hpp"
#include "wallet/signing_enclave.hpp"

namespace kasstamp::stamping {

namespace {

constexpr std::size_t kMaxUnknownOutput = 1024u * 1024u * 1024u;

}  // namespace

ReconstructionResult Reconstruct(const StampingReceipt& receipt, const PayloadLookup& lookup,
                                 wallet::SigningEnclave* enclave) {
  const bool is_private = receipt.mode == payload::StampingMode::kPrivate || receipt.encrypted;
  if (is_private) {
    if (!enclave) {
      util::Fail(util::ErrorCode::kLocked, "a signing enclave is required for private receipts");
    }
    if (receipt.group_id.empty()) {
      util::Fail(util::ErrorCode::kInvalidArgument,
                 "receipt is missing groupId; cannot decrypt private stamping");
    }
  }
  const auto transaction_ids = OpenReceiptTransactionIds(receipt, enclave);
  if (transaction_ids.empty()) {
    util::Fail(util::ErrorCode::kInvalidArgument, "receipt lists no transactions");
  }
  const auto metadata = OpenReceiptMetadata(receipt, enclave);

  std::vector<payload::Chunk> chunks;
  chunks.reserve(transaction_ids.size());
  for (const auto& id : transaction_ids) {
    const auto bytes = lookup(id);
    if (bytes.empty()) {
      util::Fail(util::ErrorCode::kPayloadTooShort, "transaction " + id + " has no payload data");
    }
    auto view = payload::OpenChunkEnvelope(bytes);
    if (!receipt.group_id.empty() && view.group_id != receipt.group_id) {
      util::Fail(util::ErrorCode::kGroupMismatch,
                 "transaction " + id + " belongs to group " + view.group_id + ", expected " +
                     receipt.group_id);
    }
    if (!receipt.chunks.empty()) {
      const auto listed = std::find_if(
          receipt.chunks.begin(), receipt.chunks.end(),
          [&](const ChunkRef& ref) { return ref.index == view.artifact.chunk_index; });
      if (listed == receipt.chunks.end() || listed->digest != view.artifact.digest) {
        util::Fail(util::ErrorCode::kDigestMismatch,
                   "chunk " + std::to_string(view.artifact.chunk_index) + " of transaction " + id +
                       " does not match the digest in the receipt");
      }
    }
    payload::Chunk chunk;
    chunk.group_id = view.group_id;
    chunk.index = view.artifact.chunk_index;
    chunk.total = view.artifact.total_chunks;
    chunk.digest = view.artifact.digest;
    chunk.data = std::move(view.artifact.chunk_data);
    chunks.push_back(std::move(chunk));
  }

  ReconstructionResult result;
  result.chunks = chunks.size();
  // JoinChunks checks group, totals, indexes and each chunk digest.
  auto data = payload::JoinChunks(std::move(chunks));

  if (is_private) {
    data = enclave->DecryptWithWalletKey(data, receipt.group_id);
    result.decrypted = true;
  }
  if (receipt.compressed) {
    const std::size_t limit = metadata.file_size > 0 ? metadata.file_size : kMaxUnknownOutput;
    std::vector<std::uint8_t> inflated;
    std::string error;
    if (!util::GzipDecompress(data, &inflated, limit, &error)) {
      util::Fail(util::ErrorCode::kDigestMismatch, "failed to decompress artifact: " + error);
    }
    data = std::move(inflated);
    result.decompressed = true;
  }

  result.file_name = metadata.file_name;
  result.original_hash = metadata.hash;
  result.reconstructed_hash = crypto::Sha256Hex(data);
  result.hash_matches = result.reconstructed_hash == result.original_hash;
  result.data = std::move(data);
  if (!result.hash_matches) {
    util::LogWarn("reconstruct: hash mismatch for '" + result.file_name + "' (expected " +
                  result.original_hash + ", got " + result.reconstructed_hash + ")");
  } else {
    util::LogInfo("reconstruct: '" + result.file_name + "' verified, " +
                  std::to_string(result.data.size()) + " bytes from " +
                  std::to_string(result.chunks) + " chunk(s)");
  }
  return result;
}

}  // namespace kasstamp::stamping
