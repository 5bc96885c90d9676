#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kasstamp::util {

std::string HexEncode(std::span<const std::uint8_t> data);

// Strict decoder: even length, [0-9a-fA-F] only. Leaves `out` empty on failure.
bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out);

// Removes an optional leading "0x"/"0X" and all ASCII whitespace, as found in
// payload dumps copied out of explorers.
std::string StripHexDecorations(std::string_view text);

// Space separated lowercase byte preview of at most `max_bytes` bytes.
std::string HexPreview(std::span<const std::uint8_t> data, std::size_t max_bytes);

bool IsHexString(std::string_view text);

}  // namespace kasstamp::util
