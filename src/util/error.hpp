#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace kasstamp::util {

// Broad failure classes. Callers branch on the category; the code narrows it
// down for diagnostics and tests.
enum class ErrorCategory : std::uint8_t {
  kEncoding = 1,
  kIntegrity = 2,
  kCustody = 3,
  kCapacity = 4,
  kNetwork = 5,
  kInvalidArgument = 6,
  kCancelled = 7,
  kInternal = 8,
};

enum class ErrorCode : std::uint16_t {
  kInvalidHex,
  kPayloadTooShort,
  kMetadataLength,
  kMetadataUtf8,
  kMetadataJson,
  kCiphertextTooShort,
  kAuthenticationFailed,
  kInvalidSeparator,
  kDigestMismatch,
  kGroupMismatch,
  kLocked,
  kWrongPassword,
  kNoMnemonic,
  kKeyNotFound,
  kBusy,
  kMassLimit,
  kNoUtxos,
  kInsufficientFunds,
  kTransactionFailed,
  kNoChangeOutput,
  kCancelled,
  kInvalidArgument,
  kCryptoFailure,
  kStorageFailure,
};

std::string_view ErrorCategoryName(ErrorCategory category);
ErrorCategory CategoryForCode(ErrorCode code);

class StampError : public std::runtime_error {
 public:
  StampError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code), category_(CategoryForCode(code)) {}

  ErrorCode code() const noexcept { return code_; }
  ErrorCategory category() const noexcept { return category_; }

 private:
  ErrorCode code_;
  ErrorCategory category_;
};

[[noreturn]] inline void Fail(ErrorCode code, const std::string& message) {
  throw StampError(code, message);
}

}  // namespace kasstamp::util
