#include "payload/payload_codec.hpp"

#include <algorithm>

#include "util/error.hpp"
#include "util/hex.hpp"

namespace kasstamp::payload {

namespace {

void AppendUint32Le(std::vector<std::uint8_t>* out, std::uint32_t value) {
  out->push_back(static_cast<std::uint8_t>(value & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
}

std::uint32_t ReadUint32Le(std::span<const std::uint8_t> bytes) {
  return static_cast<std::uint32_t>(bytes[0]) | (static_cast<std::uint32_t>(bytes[1]) << 8) |
         (static_cast<std::uint32_t>(bytes[2]) << 16) |
         (static_cast<std::uint32_t>(bytes[3]) << 24);
}

void RequireScalarObject(const nlohmann::json& metadata) {
  if (!metadata.is_object()) {
    util::Fail(util::ErrorCode::kMetadataJson, "metadata must be a JSON object");
  }
  for (const auto& [key, value] : metadata.items()) {
    if (value.is_object() || value.is_array() || value.is_binary()) {
      util::Fail(util::ErrorCode::kMetadataJson,
                 "metadata value for '" + key + "' must be a scalar");
    }
  }
}

}  // namespace

bool IsValidUtf8(std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto c = static_cast<unsigned char>(text[i]);
    std::size_t extra = 0;
    std::uint32_t cp = 0;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + extra >= text.size()) {
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto cc = static_cast<unsigned char>(text[i + k]);
      if ((cc & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3F);
    }
    // Overlong forms, surrogates and values past U+10FFFF.
    if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
        (extra == 3 && cp < 0x10000) || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

MassEstimate EstimateMass(std::size_t payload_size) {
  MassEstimate mass;
  mass.payload = payload_size;
  mass.total = mass.base + mass.inputs + mass.outputs + mass.payload;
  mass.within_limit = mass.total < kMaxTransactionMass;
  return mass;
}

EncodedPayload EncodePayload(const StampingEnvelope& envelope) {
  RequireScalarObject(envelope.metadata);
  std::string json;
  try {
    json = envelope.metadata.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
  } catch (const nlohmann::json::type_error& ex) {
    util::Fail(util::ErrorCode::kMetadataUtf8,
               std::string("metadata is not valid UTF-8: ") + ex.what());
  }
  if (json.size() > kMaxMetadataLength) {
    util::Fail(util::ErrorCode::kMetadataLength,
               "metadata too large: " + std::to_string(json.size()) + " bytes (max " +
                   std::to_string(kMaxMetadataLength) + ")");
  }

  EncodedPayload encoded;
  auto& out = encoded.payload;
  out.reserve(kMinPayloadSize + json.size() + envelope.chunk_data.size());
  AppendUint32Le(&out, static_cast<std::uint32_t>(json.size()));
  out.insert(out.end(), json.begin(), json.end());
  out.insert(out.end(), kSeparatorSize, 0x00);
  out.insert(out.end(), envelope.chunk_data.begin(), envelope.chunk_data.end());

  encoded.structure.metadata_bytes = json.size();
  encoded.structure.chunk_data_bytes = envelope.chunk_data.size();
  encoded.structure.total_bytes = out.size();
  encoded.mass = EstimateMass(out.size());
  encoded.debug.metadata_json = json;
  encoded.debug.metadata_length_hex =
      util::HexEncode(std::span<const std::uint8_t>(out.data(), kMetadataHeaderSize));
  encoded.debug.separator_hex = std::string(kSeparatorSize * 2, '0');
  encoded.debug.payload_preview = util::HexPreview(out, kDebugPreviewBytes);
  return encoded;
}

DecodedPayload DecodePayload(std::span<const std::uint8_t> bytes) {
  if (bytes.size() < kMinPayloadSize) {
    util::Fail(util::ErrorCode::kPayloadTooShort,
               "payload too short: must be at least 8 bytes (header + separator), got " +
                   std::to_string(bytes.size()));
  }
  const std::uint32_t metadata_length = ReadUint32Le(bytes.first(kMetadataHeaderSize));
  if (metadata_length > kMaxMetadataLength) {
    util::Fail(util::ErrorCode::kMetadataLength,
               "invalid metadata length: " + std::to_string(metadata_length) + " (expected 0-" +
                   std::to_string(kMaxMetadataLength) + ")");
  }
  const std::size_t required = kMinPayloadSize + metadata_length;
  if (bytes.size() < required) {
    util::Fail(util::ErrorCode::kPayloadTooShort,
               "payload too short: expected at least " + std::to_string(required) +
                   " bytes, got " + std::to_string(bytes.size()));
  }

  const auto metadata_bytes = bytes.subspan(kMetadataHeaderSize, metadata_length);
  const std::string_view text(reinterpret_cast<const char*>(metadata_bytes.data()),
                              metadata_bytes.size());
  if (!IsValidUtf8(text)) {
    util::Fail(util::ErrorCode::kMetadataUtf8, "failed to decode metadata as UTF-8");
  }
  DecodedPayload decoded;
  try {
    decoded.metadata = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& ex) {
    util::Fail(util::ErrorCode::kMetadataJson,
               std::string("failed to parse metadata JSON: ") + ex.what());
  }
  RequireScalarObject(decoded.metadata);

  const auto separator = bytes.subspan(kMetadataHeaderSize + metadata_length, kSeparatorSize);
  decoded.metadata_length = metadata_length;
  decoded.valid_separator =
      std::all_of(separator.begin(), separator.end(), [](std::uint8_t b) { return b == 0; });
  const auto chunk = bytes.subspan(required);
  decoded.chunk_data.assign(chunk.begin(), chunk.end());
  const auto preview = chunk.first(std::min(chunk.size(), kPreviewBytes));
  decoded.preview.assign(preview.begin(), preview.end());
  decoded.total_bytes = bytes.size();
  decoded.estimated_mass = kBaseTransactionMass + bytes.size();
  decoded.within_mass_limit = decoded.estimated_mass <= kMaxTransactionMass;
  return decoded;
}

DecodedPayload DecodePayloadHex(std::string_view hex) {
  const std::string cleaned = util::StripHexDecorations(hex);
  if (!util::IsHexString(cleaned)) {
    util::Fail(util::ErrorCode::kInvalidHex, "invalid hex string: contains non-hex characters");
  }
  if (cleaned.size() % 2 != 0) {
    util::Fail(util::ErrorCode::kInvalidHex, "invalid hex string: odd length");
  }
  std::vector<std::uint8_t> bytes;
  util::HexDecode(cleaned, &bytes);
  return DecodePayload(bytes);
}

}  // namespace kasstamp::payload
