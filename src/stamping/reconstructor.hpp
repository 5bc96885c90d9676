#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "stamping/stamping_receipt.hpp"

namespace kasstamp::wallet {
class SigningEnclave;
}

namespace kasstamp::stamping {

// Returns the payload bytes carried by a transaction. Implementations throw
// StampError when the transaction cannot be found.
using PayloadLookup = std::function<std::vector<std::uint8_t>(const std::string& transaction_id)>;

struct ReconstructionResult {
  std::string file_name;
  std::vector<std::uint8_t> data;
  std::string original_hash;
  std::string reconstructed_hash;
  bool hash_matches{false};
  std::size_t chunks{0};
  bool decompressed{false};
  bool decrypted{false};
};

// Reassembles a stamped artifact from its receipt. Private receipts need an
// unlocked enclave of the stamping wallet. A hash mismatch is reported in
// the result rather than thrown; malformed or foreign payloads throw.
ReconstructionResult Reconstruct(const StampingReceipt& receipt, const PayloadLookup& lookup,
                                 wallet::SigningEnclave* enclave = nullptr);

}  // namespace kasstamp::stamping
