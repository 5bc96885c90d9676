#include "payload/artifact_payload.hpp"

#include <limits>

#include "util/error.hpp"

namespace kasstamp::payload {

namespace {

std::string RequireString(const nlohmann::json& metadata, const char* key) {
  const auto it = metadata.find(key);
  if (it == metadata.end() || !it->is_string()) {
    util::Fail(util::ErrorCode::kMetadataJson,
               std::string("payload metadata is missing string field '") + key + "'");
  }
  return it->get<std::string>();
}

std::uint32_t RequireIndex(const nlohmann::json& metadata, const char* key) {
  const auto it = metadata.find(key);
  if (it == metadata.end() || !it->is_number_integer()) {
    util::Fail(util::ErrorCode::kMetadataJson,
               std::string("payload metadata is missing integer field '") + key + "'");
  }
  const auto value = it->get<std::int64_t>();
  if (value < 0 || value > std::numeric_limits<std::uint32_t>::max()) {
    util::Fail(util::ErrorCode::kMetadataJson,
               std::string("payload metadata field '") + key + "' out of range");
  }
  return static_cast<std::uint32_t>(value);
}

void RequireSeparator(const DecodedPayload& decoded, const char* what) {
  if (!decoded.valid_separator) {
    util::Fail(util::ErrorCode::kInvalidSeparator,
               std::string(what) + " separator is not zero; payload is corrupted");
  }
}

}  // namespace

std::string_view StampingModeName(StampingMode mode) {
  switch (mode) {
    case StampingMode::kPublic:
      return "public";
    case StampingMode::kPrivate:
      return "private";
  }
  return "public";
}

std::optional<StampingMode> ParseStampingMode(std::string_view name) {
  if (name == "public") return StampingMode::kPublic;
  if (name == "private") return StampingMode::kPrivate;
  return std::nullopt;
}

std::vector<std::uint8_t> SerializeArtifactPayload(const ArtifactChunkPayload& payload) {
  StampingEnvelope inner;
  inner.metadata = {
      {"fileName", payload.file_name},
      {"chunkIndex", payload.chunk_index},
      {"totalChunks", payload.total_chunks},
      {"digest", payload.digest},
      {"timestamp", payload.timestamp},
  };
  inner.chunk_data = payload.chunk_data;
  return EncodePayload(inner).payload;
}

ArtifactChunkPayload DeserializeArtifactPayload(std::span<const std::uint8_t> bytes) {
  auto decoded = DecodePayload(bytes);
  RequireSeparator(decoded, "artifact payload");
  ArtifactChunkPayload payload;
  payload.file_name = RequireString(decoded.metadata, "fileName");
  payload.chunk_index = RequireIndex(decoded.metadata, "chunkIndex");
  payload.total_chunks = RequireIndex(decoded.metadata, "totalChunks");
  payload.digest = RequireString(decoded.metadata, "digest");
  payload.timestamp = RequireString(decoded.metadata, "timestamp");
  if (payload.total_chunks == 0 || payload.chunk_index >= payload.total_chunks) {
    util::Fail(util::ErrorCode::kMetadataJson, "artifact payload chunk index out of range");
  }
  payload.chunk_data = std::move(decoded.chunk_data);
  return payload;
}

StampingEnvelope BuildChunkEnvelope(std::string_view group_id, StampingMode mode,
                                    std::vector<std::uint8_t> inner_payload) {
  StampingEnvelope envelope;
  envelope.metadata = {
      {"groupId", std::string(group_id)},
      {"mode", std::string(StampingModeName(mode))},
  };
  envelope.chunk_data = std::move(inner_payload);
  return envelope;
}

ChunkEnvelopeView OpenChunkEnvelope(std::span<const std::uint8_t> payload_bytes) {
  const auto outer = DecodePayload(payload_bytes);
  RequireSeparator(outer, "envelope");
  ChunkEnvelopeView view;
  view.group_id = RequireString(outer.metadata, "groupId");
  const auto mode = ParseStampingMode(RequireString(outer.metadata, "mode"));
  if (!mode) {
    util::Fail(util::ErrorCode::kMetadataJson, "envelope mode must be public or private");
  }
  view.mode = *mode;
  view.artifact = DeserializeArtifactPayload(outer.chunk_data);
  return view;
}

}  // namespace kasstamp::payload
