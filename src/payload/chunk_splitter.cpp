#include "payload/chunk_splitter.hpp"

#include <algorithm>
#include <limits>

#include "crypto/hash.hpp"
#include "util/csprng.hpp"
#include "util/error.hpp"

namespace kasstamp::payload {

std::vector<Chunk> SplitIntoChunks(std::span<const std::uint8_t> data,
                                   const SplitOptions& options) {
  if (options.chunk_size == 0) {
    util::Fail(util::ErrorCode::kInvalidArgument, "chunk size must be positive");
  }
  if (options.min_chunks == 0) {
    util::Fail(util::ErrorCode::kInvalidArgument, "min chunks must be positive");
  }
  if (options.group_id && options.group_id->empty()) {
    util::Fail(util::ErrorCode::kInvalidArgument, "group id must not be empty");
  }
  const std::string group_id = options.group_id ? *options.group_id : util::RandomUuidV4();

  std::size_t total = 1;
  if (data.size() > options.chunk_size || options.min_chunks > 1) {
    const std::size_t needed = (data.size() + options.chunk_size - 1) / options.chunk_size;
    total = std::max(options.min_chunks, needed);
  }
  if (total > std::numeric_limits<std::uint32_t>::max()) {
    util::Fail(util::ErrorCode::kInvalidArgument, "too many chunks");
  }

  std::vector<Chunk> chunks;
  chunks.reserve(total);
  for (std::size_t i = 0; i < total; ++i) {
    const std::size_t start = std::min(i * options.chunk_size, data.size());
    const std::size_t end = std::min(start + options.chunk_size, data.size());
    Chunk chunk;
    chunk.group_id = group_id;
    chunk.index = static_cast<std::uint32_t>(i);
    chunk.total = static_cast<std::uint32_t>(total);
    chunk.data.assign(data.begin() + static_cast<std::ptrdiff_t>(start),
                      data.begin() + static_cast<std::ptrdiff_t>(end));
    chunk.digest = crypto::Sha256Hex(chunk.data);
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

std::vector<std::uint8_t> JoinChunks(std::vector<Chunk> chunks) {
  if (chunks.empty()) {
    util::Fail(util::ErrorCode::kInvalidArgument, "no chunks to join");
  }
  std::sort(chunks.begin(), chunks.end(),
            [](const Chunk& a, const Chunk& b) { return a.index < b.index; });
  const auto& first = chunks.front();
  if (first.total != chunks.size()) {
    util::Fail(util::ErrorCode::kInvalidArgument,
               "expected " + std::to_string(first.total) + " chunks, got " +
                   std::to_string(chunks.size()));
  }
  std::vector<std::uint8_t> out;
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    const auto& chunk = chunks[i];
    if (chunk.group_id != first.group_id || chunk.total != first.total) {
      util::Fail(util::ErrorCode::kInvalidArgument, "chunks belong to different groups");
    }
    if (chunk.index != i) {
      util::Fail(util::ErrorCode::kInvalidArgument,
                 "chunk index " + std::to_string(i) + " missing or duplicated");
    }
    if (crypto::Sha256Hex(chunk.data) != chunk.digest) {
      util::Fail(util::ErrorCode::kDigestMismatch,
                 "chunk " + std::to_string(i) + " does not match its digest");
    }
    out.insert(out.end(), chunk.data.begin(), chunk.data.end());
  }
  return out;
}

}  // namespace kasstamp::payload
