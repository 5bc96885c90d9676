#include "util/error.hpp"

namespace kasstamp::util {

std::string_view ErrorCategoryName(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::kEncoding:
      return "encoding";
    case ErrorCategory::kIntegrity:
      return "integrity";
    case ErrorCategory::kCustody:
      return "custody";
    case ErrorCategory::kCapacity:
      return "capacity";
    case ErrorCategory::kNetwork:
      return "network";
    case ErrorCategory::kInvalidArgument:
      return "invalid-argument";
    case ErrorCategory::kCancelled:
      return "cancelled";
    case ErrorCategory::kInternal:
      return "internal";
  }
  return "internal";
}

ErrorCategory CategoryForCode(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidHex:
    case ErrorCode::kPayloadTooShort:
    case ErrorCode::kMetadataLength:
    case ErrorCode::kMetadataUtf8:
    case ErrorCode::kMetadataJson:
    case ErrorCode::kCiphertextTooShort:
      return ErrorCategory::kEncoding;
    case ErrorCode::kAuthenticationFailed:
    case ErrorCode::kInvalidSeparator:
    case ErrorCode::kDigestMismatch:
    case ErrorCode::kGroupMismatch:
      return ErrorCategory::kIntegrity;
    case ErrorCode::kLocked:
    case ErrorCode::kWrongPassword:
    case ErrorCode::kNoMnemonic:
    case ErrorCode::kKeyNotFound:
    case ErrorCode::kBusy:
      return ErrorCategory::kCustody;
    case ErrorCode::kMassLimit:
    case ErrorCode::kNoUtxos:
    case ErrorCode::kInsufficientFunds:
      return ErrorCategory::kCapacity;
    case ErrorCode::kTransactionFailed:
    case ErrorCode::kNoChangeOutput:
      return ErrorCategory::kNetwork;
    case ErrorCode::kCancelled:
      return ErrorCategory::kCancelled;
    case ErrorCode::kInvalidArgument:
      return ErrorCategory::kInvalidArgument;
    case ErrorCode::kCryptoFailure:
    case ErrorCode::kStorageFailure:
      return ErrorCategory::kInternal;
  }
  return ErrorCategory::kInternal;
}

}  // namespace kasstamp::util
