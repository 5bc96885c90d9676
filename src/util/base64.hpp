#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kasstamp::util {

// RFC 4648 standard alphabet with '=' padding. Used for the encrypted fields
// of private-mode receipts.
std::string Base64Encode(std::span<const std::uint8_t> input);

// Rejects characters outside the alphabet, data after padding and more than
// two padding characters. ASCII whitespace is skipped.
bool Base64Decode(std::string_view input, std::vector<std::uint8_t>* out);

// Shape check only; does not decode.
bool LooksLikeBase64(std::string_view input);

}  // namespace kasstamp::util
