#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"

namespace kasstamp::payload {

// Wire layout of a stamping payload:
//   u32-le metadata length | UTF-8 JSON metadata | 00 00 00 00 | chunk bytes
inline constexpr std::size_t kMetadataHeaderSize = 4;
inline constexpr std::size_t kSeparatorSize = 4;
inline constexpr std::size_t kMinPayloadSize = kMetadataHeaderSize + kSeparatorSize;
inline constexpr std::size_t kMaxMetadataLength = 10000;
inline constexpr std::size_t kPreviewBytes = 256;
inline constexpr std::size_t kDebugPreviewBytes = 100;

// Heuristic mass model: one consolidated input, one change output.
inline constexpr std::uint64_t kBaseTransactionMass = 200;
inline constexpr std::uint64_t kMassPerInput = 1118;
inline constexpr std::uint64_t kMassPerOutput = 846;
inline constexpr std::uint64_t kMaxTransactionMass = 100000;

// Metadata is a JSON object whose values are scalars (string, number,
// boolean, null).
struct StampingEnvelope {
  nlohmann::json metadata = nlohmann::json::object();
  std::vector<std::uint8_t> chunk_data;

  bool operator==(const StampingEnvelope& other) const {
    return metadata == other.metadata && chunk_data == other.chunk_data;
  }
};

struct PayloadStructure {
  std::size_t metadata_length_bytes{kMetadataHeaderSize};
  std::size_t metadata_bytes{0};
  std::size_t separator_bytes{kSeparatorSize};
  std::size_t chunk_data_bytes{0};
  std::size_t total_bytes{0};
};

// Advisory only; the transaction service computes the exact mass.
struct MassEstimate {
  std::uint64_t base{kBaseTransactionMass};
  std::uint64_t inputs{kMassPerInput};
  std::uint64_t outputs{kMassPerOutput};
  std::uint64_t payload{0};
  std::uint64_t total{0};
  bool within_limit{true};
};

struct PayloadDebugInfo {
  std::string metadata_json;
  std::string metadata_length_hex;
  std::string separator_hex;
  std::string payload_preview;  // first 100 bytes, space separated hex
};

struct EncodedPayload {
  std::vector<std::uint8_t> payload;
  PayloadStructure structure;
  MassEstimate mass;
  PayloadDebugInfo debug;
};

struct DecodedPayload {
  nlohmann::json metadata;
  std::uint32_t metadata_length{0};
  bool valid_separator{false};
  std::vector<std::uint8_t> chunk_data;
  std::vector<std::uint8_t> preview;  // first 256 chunk bytes
  std::size_t total_bytes{0};
  std::uint64_t estimated_mass{0};
  bool within_mass_limit{false};

  StampingEnvelope envelope() const { return {metadata, chunk_data}; }
};

MassEstimate EstimateMass(std::size_t payload_size);

// Serializes metadata as compact JSON with keys in sorted order. Throws
// StampError(kMetadataJson) for non-object metadata or non-scalar values,
// StampError(kMetadataUtf8) for strings that are not UTF-8 and
// StampError(kMetadataLength) above kMaxMetadataLength bytes.
EncodedPayload EncodePayload(const StampingEnvelope& envelope);

// Exact inverse of EncodePayload. Malformed input raises encoding errors; a
// non-zero separator is reported through `valid_separator` only.
DecodedPayload DecodePayload(std::span<const std::uint8_t> bytes);

// Accepts an optional "0x" prefix and embedded whitespace.
DecodedPayload DecodePayloadHex(std::string_view hex);

bool IsValidUtf8(std::string_view text);

}  // namespace kasstamp::payload
