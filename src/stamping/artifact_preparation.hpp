#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "payload/artifact_payload.hpp"
#include "payload/chunk_splitter.hpp"

namespace kasstamp::wallet {
class SigningEnclave;
}

namespace kasstamp::stamping {

inline constexpr std::string_view kDefaultTextName = "text-input.txt";

struct ArtifactInput {
  std::string name;
  std::vector<std::uint8_t> bytes;
  bool is_text{false};
};

ArtifactInput TextArtifact(const std::string& text, const std::string& name = {});

struct PreparationOptions {
  bool compress{true};
  std::size_t chunk_size{payload::kDefaultChunkSize};
  std::optional<std::string> group_id;
};

struct PreparedArtifact {
  std::string file_name;
  std::uint64_t file_size{0};
  std::string original_digest;
  std::string group_id;
  payload::StampingMode mode{payload::StampingMode::kPublic};
  bool compressed{false};
  bool encrypted{false};
  std::size_t processed_size{0};
  std::string timestamp;
  std::vector<payload::Chunk> chunks;
  // One encoded on-chain payload per chunk, in chunk order.
  std::vector<std::vector<std::uint8_t>> payloads;
};

// Hashes, optionally compresses, encrypts (private mode) and splits an
// artifact, then builds the on-chain payload for every chunk. Private mode
// needs an unlocked enclave; the whole processed blob is sealed under the
// wallet key for the artifact's group id before splitting.
PreparedArtifact PrepareArtifact(const ArtifactInput& artifact, payload::StampingMode mode,
                                 const PreparationOptions& options,
                                 wallet::SigningEnclave* enclave = nullptr);

}  // namespace kasstamp::stamping
