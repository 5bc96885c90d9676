#include "util/base64.hpp"

#include <array>
#include <cctype>

namespace kasstamp::util {

namespace {

constexpr std::string_view kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr int kPadding = -2;
constexpr int kInvalid = -1;

constexpr std::array<int, 256> BuildDecodeTable() {
  std::array<int, 256> table{};
  table.fill(kInvalid);
  for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
    table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int>(i);
  }
  table[static_cast<unsigned char>('=')] = kPadding;
  return table;
}

constexpr auto kDecodeTable = BuildDecodeTable();

}  // namespace

std::string Base64Encode(std::span<const std::uint8_t> input) {
  std::string out;
  out.reserve(((input.size() + 2) / 3) * 4);
  std::size_t i = 0;
  for (; i + 3 <= input.size(); i += 3) {
    const std::uint32_t group = (static_cast<std::uint32_t>(input[i]) << 16) |
                                (static_cast<std::uint32_t>(input[i + 1]) << 8) |
                                static_cast<std::uint32_t>(input[i + 2]);
    out.push_back(kAlphabet[(group >> 18) & 0x3F]);
    out.push_back(kAlphabet[(group >> 12) & 0x3F]);
    out.push_back(kAlphabet[(group >> 6) & 0x3F]);
    out.push_back(kAlphabet[group & 0x3F]);
  }
  const std::size_t rest = input.size() - i;
  if (rest == 1) {
    const std::uint32_t group = static_cast<std::uint32_t>(input[i]) << 16;
    out.push_back(kAlphabet[(group >> 18) & 0x3F]);
    out.push_back(kAlphabet[(group >> 12) & 0x3F]);
    out.append("==");
  } else if (rest == 2) {
    const std::uint32_t group = (static_cast<std::uint32_t>(input[i]) << 16) |
                                (static_cast<std::uint32_t>(input[i + 1]) << 8);
    out.push_back(kAlphabet[(group >> 18) & 0x3F]);
    out.push_back(kAlphabet[(group >> 12) & 0x3F]);
    out.push_back(kAlphabet[(group >> 6) & 0x3F]);
    out.push_back('=');
  }
  return out;
}

bool Base64Decode(std::string_view input, std::vector<std::uint8_t>* out) {
  if (!out) {
    return false;
  }
  out->clear();
  out->reserve((input.size() * 3) / 4);
  std::uint32_t acc = 0;
  int bits = -8;
  int padding = 0;
  for (unsigned char c : input) {
    if (std::isspace(c)) {
      continue;
    }
    const int value = kDecodeTable[c];
    if (value == kInvalid) {
      out->clear();
      return false;
    }
    if (value == kPadding) {
      if (++padding > 2) {
        out->clear();
        return false;
      }
      continue;
    }
    if (padding > 0) {
      out->clear();
      return false;
    }
    acc = (acc << 6) | static_cast<std::uint32_t>(value);
    bits += 6;
    if (bits >= 0) {
      out->push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
      bits -= 8;
    }
  }
  return true;
}

bool LooksLikeBase64(std::string_view input) {
  if (input.empty() || input.size() % 4 != 0) {
    return false;
  }
  std::size_t padding = 0;
  for (std::size_t i = 0; i < input.size(); ++i) {
    const int value = kDecodeTable[static_cast<unsigned char>(input[i])];
    if (value == kInvalid) {
      return false;
    }
    if (value == kPadding) {
      ++padding;
    } else if (padding > 0) {
      return false;
    }
  }
  return padding <= 2;
}

}  // namespace kasstamp::util
