#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "payload/payload_codec.hpp"

namespace kasstamp::payload {

enum class StampingMode {
  kPublic,
  kPrivate,
};

std::string_view StampingModeName(StampingMode mode);
std::optional<StampingMode> ParseStampingMode(std::string_view name);

// File name written into inner payloads and receipts of private stamps.
inline constexpr std::string_view kRedactedField = "[encrypted]";

// One chunk of an artifact as carried inside a stamping envelope. It uses
// the same wire layout as the envelope itself, with these fields as the
// metadata and the chunk bytes as the body.
struct ArtifactChunkPayload {
  std::string file_name;
  std::uint32_t chunk_index{0};
  std::uint32_t total_chunks{0};
  std::string digest;
  std::string timestamp;
  std::vector<std::uint8_t> chunk_data;
};

std::vector<std::uint8_t> SerializeArtifactPayload(const ArtifactChunkPayload& payload);

// Throws encoding errors for malformed bytes or missing fields and
// StampError(kInvalidSeparator) when the separator is not zero.
ArtifactChunkPayload DeserializeArtifactPayload(std::span<const std::uint8_t> bytes);

// Outer envelope: {groupId, mode} metadata around a serialized inner payload.
StampingEnvelope BuildChunkEnvelope(std::string_view group_id, StampingMode mode,
                                    std::vector<std::uint8_t> inner_payload);

struct ChunkEnvelopeView {
  std::string group_id;
  StampingMode mode{StampingMode::kPublic};
  ArtifactChunkPayload artifact;
};

// Decodes an on-chain payload down to the artifact chunk it carries.
ChunkEnvelopeView OpenChunkEnvelope(std::span<const std::uint8_t> payload_bytes);

}  // namespace kasstamp::payload
