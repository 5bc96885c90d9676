#include "stamping/receipt_validator.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <string_view>

#include "util/base64.hpp"
#include "util/time_format.hpp"

namespace kasstamp::stamping {

namespace {

constexpr double kMaxFileSize = 10.0 * 1024 * 1024 * 1024;
constexpr double kMaxChunkCount = 100000;
constexpr std::size_t kMaxTransactionIds = 100000;
constexpr std::size_t kMaxFileNameLength = 255;
constexpr double kMaxCostKas = 1000000;
constexpr std::size_t kMaxStringField = 10000;
constexpr std::size_t kCheckedTransactionIds = 10;

constexpr std::array<std::string_view, 29> kDangerousExtensions = {
    ".exe", ".dll", ".bat", ".cmd", ".com", ".scr", ".pif", ".app", ".dmg", ".pkg",
    ".sh",  ".bash", ".zsh", ".ps1", ".psm1", ".vbs", ".vbe", ".js",  ".jse", ".wsf",
    ".wsh", ".msi", ".msp", ".jar", ".apk", ".deb", ".rpm", ".lnk", ".reg"};

struct SuspiciousPattern {
  const char* source;
  std::regex regex;
};

const std::vector<SuspiciousPattern>& SuspiciousPatterns() {
  static const std::vector<SuspiciousPattern> patterns = [] {
    const auto icase = std::regex::ECMAScript | std::regex::icase;
    std::vector<SuspiciousPattern> out;
    for (const char* source :
         {"<script[^>]*>", "javascript:", "on\\w+\\s*=", "data:text/html", "vbscript:",
          "<iframe[^>]*>", "<object[^>]*>", "<embed[^>]*>", "\\.\\.[\\\\/]", "[<>'\"]"}) {
      out.push_back({source, std::regex(source, icase)});
    }
    return out;
  }();
  return patterns;
}

class Checker {
 public:
  void Error(std::string message) { result_.errors.push_back(std::move(message)); }
  void Warn(std::string message) { result_.warnings.push_back(std::move(message)); }

  // Type, length and markup checks shared by all free-text fields.
  bool StringField(const nlohmann::json& value, const std::string& field, std::size_t max_length) {
    if (!value.is_string()) {
      Error(field + " must be a string");
      return false;
    }
    const auto& text = value.get_ref<const std::string&>();
    if (text.size() > max_length) {
      Error(field + " exceeds maximum length (" + std::to_string(max_length) + ")");
    }
    for (const auto& pattern : SuspiciousPatterns()) {
      if (std::regex_search(text, pattern.regex)) {
        Warn(field + " contains suspicious pattern: " + pattern.source);
      }
    }
    return true;
  }

  void EncryptedField(const nlohmann::json& value, const std::string& field) {
    if (!value.is_string()) {
      Error(field + " must be a string");
      return;
    }
    const auto& text = value.get_ref<const std::string&>();
    std::vector<std::uint8_t> decoded;
    if (!util::Base64Decode(text, &decoded)) {
      Error(field + " is not valid base64");
    }
    if (text.size() > kMaxStringField) {
      Error(field + " is suspiciously large");
    }
  }

  ValidationResult Finish() {
    result_.valid = result_.errors.empty();
    return std::move(result_);
  }

 private:
  ValidationResult result_;
};

bool IsHex64(const std::string& text) {
  return text.size() == 64 && std::all_of(text.begin(), text.end(), [](char c) {
           return std::isxdigit(static_cast<unsigned char>(c)) != 0;
         });
}

bool IsUuidShape(const std::string& text) {
  return text.size() == 36 && std::all_of(text.begin(), text.end(), [](char c) {
           return c == '-' || std::isxdigit(static_cast<unsigned char>(c)) != 0;
         });
}

std::string LowerExtension(const std::string& file_name) {
  const auto dot = file_name.rfind('.');
  if (dot == std::string::npos) {
    return {};
  }
  std::string ext = file_name.substr(dot);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

const nlohmann::json* Find(const nlohmann::json& object, const char* key) {
  const auto it = object.find(key);
  return it == object.end() ? nullptr : &*it;
}

std::string FormatNumber(const nlohmann::json& value) { return value.dump(); }

}  // namespace

ValidationResult ValidateReceipt(const nlohmann::json& receipt) {
  Checker check;
  if (!receipt.is_object()) {
    check.Error("Receipt must be a non-null object");
    return check.Finish();
  }
  static const nlohmann::json kMissing;
  auto field = [&](const char* key) -> const nlohmann::json& {
    const auto* value = Find(receipt, key);
    return value ? *value : kMissing;
  };

  const auto& id = field("id");
  if (!id.is_string()) {
    check.Error("Receipt id must be a string");
  } else if (!IsHex64(id.get<std::string>())) {
    check.Error("Receipt id is not a valid transaction ID format");
  }

  const auto& timestamp = field("timestamp");
  if (!timestamp.is_string()) {
    check.Error("Receipt timestamp must be a string");
  } else if (!util::ParseIso8601(timestamp.get<std::string>())) {
    check.Error("Receipt timestamp is not a valid ISO 8601 date");
  }

  const auto& file_name = field("fileName");
  if (check.StringField(file_name, "fileName", kMaxFileNameLength)) {
    const auto& name = file_name.get_ref<const std::string&>();
    const auto ext = LowerExtension(name);
    if (!ext.empty() && std::find(kDangerousExtensions.begin(), kDangerousExtensions.end(), ext) !=
                            kDangerousExtensions.end()) {
      check.Warn("Filename has potentially dangerous extension: " + ext +
                 ". Only download if you trust the source!");
    }
    if (name.find('\0') != std::string::npos) {
      check.Error("Filename contains null bytes");
    }
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
      check.Warn("Filename contains path separators (should be just a filename)");
    }
  }

  const auto& file_size = field("fileSize");
  if (!file_size.is_number()) {
    check.Error("Receipt fileSize must be a number");
  } else {
    if (file_size.get<double>() < 0) {
      check.Error("Receipt fileSize cannot be negative");
    }
    if (file_size.get<double>() > kMaxFileSize) {
      check.Warn("Receipt fileSize is very large (" + FormatNumber(file_size) + " bytes)");
    }
  }

  check.StringField(field("hash"), "hash", 128);

  if (const auto* encrypted_metadata = Find(receipt, "encryptedMetadata")) {
    check.EncryptedField(*encrypted_metadata, "encryptedMetadata");
  }

  const auto& privacy_field = Find(receipt, "mode") ? field("mode") : field("privacy");
  std::string privacy;
  if (!privacy_field.is_string()) {
    check.Error("Receipt privacy must be a string");
  } else {
    privacy = privacy_field.get<std::string>();
    if (privacy != "public" && privacy != "private") {
      check.Error("Receipt privacy must be \"public\" or \"private\"");
    }
  }

  if (!field("encrypted").is_boolean()) {
    check.Error("Receipt encrypted must be a boolean");
  }
  if (!field("compressed").is_boolean()) {
    check.Error("Receipt compressed must be a boolean");
  }

  const auto* group_id = Find(receipt, "groupId");
  if (group_id && !group_id->is_null()) {
    if (!group_id->is_string()) {
      check.Error("Receipt groupId must be a string");
    } else if (!IsUuidShape(group_id->get<std::string>())) {
      check.Warn("Receipt groupId is not a valid UUID format");
    }
  } else if (privacy == "private") {
    check.Error("Receipt groupId is required for private mode");
  }

  const auto& ids = field("transactionIds");
  if (ids.is_array()) {
    if (ids.empty()) {
      check.Error("Receipt transactionIds array is empty");
    }
    if (ids.size() > kMaxTransactionIds) {
      check.Warn("Receipt has very many transactions (" + std::to_string(ids.size()) + ")");
    }
    for (std::size_t i = 0; i < std::min(ids.size(), kCheckedTransactionIds); ++i) {
      if (!ids[i].is_string()) {
        check.Error("Transaction ID at index " + std::to_string(i) + " is not a string");
      } else if (!IsHex64(ids[i].get<std::string>())) {
        check.Error("Transaction ID at index " + std::to_string(i) + " is not a valid format");
      }
    }
  } else if (ids.is_string()) {
    check.EncryptedField(ids, "transactionIds");
  } else {
    check.Error("Receipt transactionIds must be an array or encrypted string");
  }

  const auto* ids_encrypted = Find(receipt, "transactionIdsEncrypted");
  if (ids_encrypted && !ids_encrypted->is_boolean()) {
    check.Error("Receipt transactionIdsEncrypted must be a boolean");
  }
  const bool ids_flagged_encrypted =
      ids_encrypted && ids_encrypted->is_boolean() && ids_encrypted->get<bool>();

  const auto& chunk_count = field("chunkCount");
  if (!chunk_count.is_number()) {
    check.Error("Receipt chunkCount must be a number");
  } else {
    if (chunk_count.get<double>() <= 0) {
      check.Error("Receipt chunkCount must be positive");
    }
    if (chunk_count.get<double>() > kMaxChunkCount) {
      check.Warn("Receipt has very many chunks (" + FormatNumber(chunk_count) + ")");
    }
  }

  if (const auto* chunks = Find(receipt, "chunks"); chunks && !chunks->is_null()) {
    if (!chunks->is_array()) {
      check.Error("Receipt chunks must be an array");
    } else {
      for (std::size_t i = 0; i < chunks->size(); ++i) {
        const auto& chunk = (*chunks)[i];
        const auto* index = chunk.is_object() ? Find(chunk, "index") : nullptr;
        const auto* total = chunk.is_object() ? Find(chunk, "total") : nullptr;
        const auto* digest = chunk.is_object() ? Find(chunk, "digest") : nullptr;
        if (!index || !index->is_number_unsigned() || !total || !total->is_number_unsigned()) {
          check.Error("Chunk at index " + std::to_string(i) + " lacks an integer index or total");
        } else if (index->get<std::uint64_t>() >= total->get<std::uint64_t>()) {
          check.Error("Chunk at index " + std::to_string(i) + " is outside its total");
        }
        if (!digest || !digest->is_string() || !IsHex64(digest->get<std::string>())) {
          check.Error("Chunk at index " + std::to_string(i) + " has no SHA-256 hex digest");
        }
      }
      if (chunk_count.is_number() &&
          static_cast<double>(chunks->size()) != chunk_count.get<double>()) {
        check.Warn("Chunk count mismatch: chunkCount (" + FormatNumber(chunk_count) +
                   ") !== chunks.length (" + std::to_string(chunks->size()) + ")");
      }
    }
  }

  const auto& cost = field("totalCostKAS");
  if (!cost.is_number()) {
    check.Error("Receipt totalCostKAS must be a number");
  } else {
    if (cost.get<double>() < 0) {
      check.Error("Receipt totalCostKAS cannot be negative");
    }
    if (cost.get<double>() > kMaxCostKas) {
      check.Warn("Receipt cost is very high (" + FormatNumber(cost) + " KAS)");
    }
  }

  if (const auto* network = Find(receipt, "network")) {
    check.StringField(*network, "network", 50);
  }
  if (const auto* address = Find(receipt, "walletAddress")) {
    check.StringField(*address, "walletAddress", 200);
  }

  if (ids.is_array() && chunk_count.is_number() &&
      static_cast<double>(ids.size()) != chunk_count.get<double>()) {
    check.Warn("Chunk count mismatch: chunkCount (" + FormatNumber(chunk_count) +
               ") !== transactionIds.length (" + std::to_string(ids.size()) + ")");
  }

  if (privacy == "private") {
    const auto& encrypted = field("encrypted");
    if (!encrypted.is_boolean() || !encrypted.get<bool>()) {
      check.Warn("Receipt is marked as private but encrypted flag is false");
    }
    if (!ids_flagged_encrypted && ids.is_array()) {
      check.Warn("Private receipt has plaintext transaction IDs");
    }
  }
  if (privacy == "public" && ids_flagged_encrypted) {
    check.Warn("Public receipt has encrypted transaction IDs");
  }

  return check.Finish();
}

}  // namespace kasstamp::stamping
