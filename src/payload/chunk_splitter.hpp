#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kasstamp::payload {

inline constexpr std::size_t kDefaultChunkSize = 20000;

struct Chunk {
  std::string group_id;
  std::uint32_t index{0};
  std::uint32_t total{0};
  std::vector<std::uint8_t> data;
  std::string digest;  // SHA-256 hex of `data`
};

struct SplitOptions {
  std::size_t chunk_size{kDefaultChunkSize};
  // Fresh UUID v4 when unset.
  std::optional<std::string> group_id;
  std::size_t min_chunks{1};
};

// Partition `data` into contiguous chunks in index order. One chunk when the
// data fits and min_chunks <= 1; otherwise max(min_chunks, ceil(len / size))
// chunks, where chunks past the end of the data are empty. Throws
// StampError(kInvalidArgument) for a zero chunk size or zero min_chunks.
std::vector<Chunk> SplitIntoChunks(std::span<const std::uint8_t> data,
                                   const SplitOptions& options = {});

// Inverse of SplitIntoChunks. Accepts chunks in any order; requires one group
// id, one total and every index exactly once, and recomputes each digest.
// Throws StampError(kInvalidArgument) on a malformed set and
// StampError(kDigestMismatch) when a chunk's bytes do not match its digest.
std::vector<std::uint8_t> JoinChunks(std::vector<Chunk> chunks);

}  // namespace kasstamp::payload
