#include "util/hex.hpp"

#include <algorithm>
#include <cctype>

namespace kasstamp::util {

namespace {

constexpr char kHexLower[] = "0123456789abcdef";

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

}  // namespace

std::string HexEncode(std::span<const std::uint8_t> data) {
  std::string out;
  out.resize(data.size() * 2);
  for (std::size_t i = 0; i < data.size(); ++i) {
    out[i * 2] = kHexLower[(data[i] >> 4) & 0x0F];
    out[i * 2 + 1] = kHexLower[data[i] & 0x0F];
  }
  return out;
}

bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out) {
  out->clear();
  if (hex.size() % 2 != 0) {
    return false;
  }
  out->reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = HexValue(hex[i]);
    const int lo = HexValue(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      out->clear();
      return false;
    }
    out->push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return true;
}

std::string StripHexDecorations(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) == 0) {
      out.push_back(c);
    }
  }
  if (out.size() >= 2 && out[0] == '0' && (out[1] == 'x' || out[1] == 'X')) {
    out.erase(0, 2);
  }
  return out;
}

std::string HexPreview(std::span<const std::uint8_t> data, std::size_t max_bytes) {
  const std::size_t count = std::min(data.size(), max_bytes);
  std::string out;
  out.reserve(count * 3);
  for (std::size_t i = 0; i < count; ++i) {
    if (i != 0) {
      out.push_back(' ');
    }
    out.push_back(kHexLower[(data[i] >> 4) & 0x0F]);
    out.push_back(kHexLower[data[i] & 0x0F]);
  }
  return out;
}

bool IsHexString(std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](char c) { return HexValue(c) >= 0; });
}

}  // namespace kasstamp::util
