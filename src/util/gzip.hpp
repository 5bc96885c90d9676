#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace kasstamp::util {

// RFC 1952 gzip framing over zlib deflate. Level 9, as stamped artifacts are
// written once and paid for per byte.
bool GzipCompress(std::span<const std::uint8_t> input, std::vector<std::uint8_t>* out,
                  std::string* error = nullptr);

// Refuses to inflate beyond `max_output` bytes.
bool GzipDecompress(std::span<const std::uint8_t> input, std::vector<std::uint8_t>* out,
                    std::size_t max_output, std::string* error = nullptr);

}  // namespace kasstamp::util
