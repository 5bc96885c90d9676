#include "crypto/address.hpp"

#include <array>

namespace kasstamp::crypto {

namespace {

constexpr std::array<char, 32> kCharset = {
    'q', 'p', 'z', 'r', 'y', '9', 'x', '8', 'g', 'f', '2', 't', 'v', 'd', 'w', '0',
    's', '3', 'j', 'n', '5', '4', 'k', 'h', 'c', 'e', '6', 'm', 'u', 'a', '7', 'l'};

constexpr std::array<int, 128> CreateDecodeMap() {
  std::array<int, 128> map{};
  map.fill(-1);
  for (std::size_t i = 0; i < kCharset.size(); ++i) {
    map[static_cast<unsigned>(kCharset[i])] = static_cast<int>(i);
  }
  return map;
}

constexpr auto kDecodeMap = CreateDecodeMap();
constexpr std::size_t kChecksumChars = 8;

std::uint64_t Polymod(const std::vector<std::uint8_t>& values) {
  std::uint64_t c = 1;
  for (std::uint8_t d : values) {
    const std::uint64_t c0 = c >> 35;
    c = ((c & 0x07ffffffffULL) << 5) ^ d;
    if (c0 & 0x01) c ^= 0x98f2bc8e61ULL;
    if (c0 & 0x02) c ^= 0x79b76d99e2ULL;
    if (c0 & 0x04) c ^= 0xf33e5fb3c4ULL;
    if (c0 & 0x08) c ^= 0xae2eabe2a8ULL;
    if (c0 & 0x10) c ^= 0x1e4f43e470ULL;
  }
  return c ^ 1;
}

std::uint64_t Checksum(std::string_view prefix, const std::vector<std::uint8_t>& data5) {
  std::vector<std::uint8_t> values;
  values.reserve(prefix.size() + 1 + data5.size() + kChecksumChars);
  for (char c : prefix) {
    values.push_back(static_cast<std::uint8_t>(c & 0x1F));
  }
  values.push_back(0);
  values.insert(values.end(), data5.begin(), data5.end());
  values.insert(values.end(), kChecksumChars, 0);
  return Polymod(values);
}

bool ConvertBits(std::vector<std::uint8_t>* out, int from_bits, int to_bits, bool pad,
                 std::span<const std::uint8_t> data) {
  std::uint32_t acc = 0;
  int bits = 0;
  const std::uint32_t maxv = (1u << to_bits) - 1;
  for (std::uint8_t value : data) {
    if (value >> from_bits) {
      return false;
    }
    acc = (acc << from_bits) | value;
    bits += from_bits;
    while (bits >= to_bits) {
      bits -= to_bits;
      out->push_back(static_cast<std::uint8_t>((acc >> bits) & maxv));
    }
  }
  if (pad) {
    if (bits) {
      out->push_back(static_cast<std::uint8_t>((acc << (to_bits - bits)) & maxv));
    }
  } else if (bits >= from_bits || ((acc << (to_bits - bits)) & maxv)) {
    return false;
  }
  return true;
}

std::optional<std::size_t> PayloadSizeFor(std::uint8_t version) {
  switch (static_cast<AddressVersion>(version)) {
    case AddressVersion::kPubKey:
    case AddressVersion::kScriptHash:
      return 32;
    case AddressVersion::kPubKeyEcdsa:
      return 33;
  }
  return std::nullopt;
}

}  // namespace

std::string EncodeAddress(std::string_view prefix, AddressVersion version,
                          std::span<const std::uint8_t> payload) {
  std::vector<std::uint8_t> raw;
  raw.reserve(payload.size() + 1);
  raw.push_back(static_cast<std::uint8_t>(version));
  raw.insert(raw.end(), payload.begin(), payload.end());

  std::vector<std::uint8_t> data5;
  ConvertBits(&data5, 8, 5, true, raw);
  const std::uint64_t checksum = Checksum(prefix, data5);

  std::string out(prefix);
  out.push_back(':');
  for (auto v : data5) {
    out.push_back(kCharset[v]);
  }
  for (std::size_t i = 0; i < kChecksumChars; ++i) {
    const auto shift = 5 * (kChecksumChars - 1 - i);
    out.push_back(kCharset[(checksum >> shift) & 0x1F]);
  }
  return out;
}

std::string AddressFromXOnlyKey(std::string_view prefix, const std::array<std::uint8_t, 32>& key) {
  return EncodeAddress(prefix, AddressVersion::kPubKey, key);
}

std::optional<DecodedAddress> DecodeAddress(std::string_view address) {
  const auto colon = address.find(':');
  if (colon == std::string_view::npos || colon == 0 || colon + 1 + kChecksumChars >= address.size()) {
    return std::nullopt;
  }
  const std::string_view prefix = address.substr(0, colon);
  const std::string_view body = address.substr(colon + 1);
  for (char c : prefix) {
    if (c < 'a' || c > 'z') {
      return std::nullopt;
    }
  }
  std::vector<std::uint8_t> values;
  values.reserve(body.size());
  for (char c : body) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc >= 128 || kDecodeMap[uc] < 0) {
      return std::nullopt;
    }
    values.push_back(static_cast<std::uint8_t>(kDecodeMap[uc]));
  }
  std::vector<std::uint8_t> data5(values.begin(), values.end() - kChecksumChars);
  std::uint64_t expected = 0;
  for (std::size_t i = values.size() - kChecksumChars; i < values.size(); ++i) {
    expected = (expected << 5) | values[i];
  }
  if (Checksum(prefix, data5) != expected) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> raw;
  if (!ConvertBits(&raw, 5, 8, false, data5) || raw.empty()) {
    return std::nullopt;
  }
  const auto size = PayloadSizeFor(raw[0]);
  if (!size || raw.size() != *size + 1) {
    return std::nullopt;
  }
  DecodedAddress decoded;
  decoded.prefix = std::string(prefix);
  decoded.version = static_cast<AddressVersion>(raw[0]);
  decoded.payload.assign(raw.begin() + 1, raw.end());
  return decoded;
}

std::vector<std::uint8_t> PayToAddressScript(const DecodedAddress& address) {
  constexpr std::uint8_t kOpCheckSig = 0xac;
  constexpr std::uint8_t kOpCheckSigEcdsa = 0xab;
  constexpr std::uint8_t kOpBlake2b = 0xaa;
  constexpr std::uint8_t kOpEqual = 0x87;
  std::vector<std::uint8_t> script;
  script.reserve(address.payload.size() + 3);
  switch (address.version) {
    case AddressVersion::kPubKey:
      script.push_back(static_cast<std::uint8_t>(address.payload.size()));
      script.insert(script.end(), address.payload.begin(), address.payload.end());
      script.push_back(kOpCheckSig);
      break;
    case AddressVersion::kPubKeyEcdsa:
      script.push_back(static_cast<std::uint8_t>(address.payload.size()));
      script.insert(script.end(), address.payload.begin(), address.payload.end());
      script.push_back(kOpCheckSigEcdsa);
      break;
    case AddressVersion::kScriptHash:
      script.push_back(kOpBlake2b);
      script.push_back(static_cast<std::uint8_t>(address.payload.size()));
      script.insert(script.end(), address.payload.begin(), address.payload.end());
      script.push_back(kOpEqual);
      break;
  }
  return script;
}

}  // namespace kasstamp::crypto
