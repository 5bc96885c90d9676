#include "stamping/artifact_preparation.hpp"

#include "crypto/hash.hpp"
#include "payload/payload_codec.hpp"
#include "util/csprng.hpp"
#include "util/error.hpp"
#include "util/gzip.hpp"
#include "util/logging.hpp"
#include "util/time_format.hpp"
#include "wallet/signing_enclave.hpp"

namespace kasstamp::stamping {

ArtifactInput TextArtifact(const std::string& text, const std::string& name) {
  ArtifactInput input;
  input.name = name.empty() ? std::string(kDefaultTextName) : name;
  input.bytes.assign(text.begin(), text.end());
  input.is_text = true;
  return input;
}

PreparedArtifact PrepareArtifact(const ArtifactInput& artifact, payload::StampingMode mode,
                                 const PreparationOptions& options,
                                 wallet::SigningEnclave* enclave) {
  const bool is_private = mode == payload::StampingMode::kPrivate;
  if (is_private) {
    if (!enclave) {
      util::Fail(util::ErrorCode::kInvalidArgument, "private mode requires a signing enclave");
    }
    if (enclave->IsLocked()) {
      util::Fail(util::ErrorCode::kLocked, "signing enclave is locked; unlock the wallet first");
    }
  }

  PreparedArtifact prepared;
  prepared.file_name = artifact.name.empty() && artifact.is_text ? std::string(kDefaultTextName)
                                                                 : artifact.name;
  prepared.file_size = artifact.bytes.size();
  prepared.original_digest = crypto::Sha256Hex(artifact.bytes);
  prepared.group_id = options.group_id ? *options.group_id : util::RandomUuidV4();
  prepared.mode = mode;
  prepared.timestamp = util::Iso8601NowUtc();

  std::vector<std::uint8_t> processed = artifact.bytes;
  if (options.compress) {
    std::vector<std::uint8_t> compressed;
    std::string error;
    if (!util::GzipCompress(artifact.bytes, &compressed, &error)) {
      util::LogWarn("prepare: compression of '" + prepared.file_name + "' failed (" + error +
                    "), storing uncompressed");
    } else if (compressed.size() < processed.size()) {
      util::LogDebug("prepare: compressed '" + prepared.file_name + "' " +
                     std::to_string(processed.size()) + " -> " +
                     std::to_string(compressed.size()) + " bytes");
      processed = std::move(compressed);
      prepared.compressed = true;
    } else {
      util::LogDebug("prepare: compression did not shrink '" + prepared.file_name + "', skipped");
    }
  }

  if (is_private) {
    processed = enclave->EncryptWithWalletKey(processed, prepared.group_id);
    prepared.encrypted = true;
  }
  prepared.processed_size = processed.size();

  payload::SplitOptions split;
  split.chunk_size = options.chunk_size;
  split.group_id = prepared.group_id;
  prepared.chunks = payload::SplitIntoChunks(processed, split);

  const std::string inner_name =
      is_private ? std::string(payload::kRedactedField) : prepared.file_name;
  prepared.payloads.reserve(prepared.chunks.size());
  for (const auto& chunk : prepared.chunks) {
    payload::ArtifactChunkPayload inner;
    inner.file_name = inner_name;
    inner.chunk_index = chunk.index;
    inner.total_chunks = chunk.total;
    inner.digest = chunk.digest;
    inner.timestamp = prepared.timestamp;
    inner.chunk_data = chunk.data;
    auto envelope = payload::BuildChunkEnvelope(prepared.group_id, mode,
                                                payload::SerializeArtifactPayload(inner));
    prepared.payloads.push_back(payload::EncodePayload(envelope).payload);
  }
  util::LogInfo("prepare: '" + prepared.file_name + "' -> " +
                std::to_string(prepared.chunks.size()) + " chunk(s), mode " +
                std::string(payload::StampingModeName(mode)));
  return prepared;
}

}  // namespace kasstamp::stamping
