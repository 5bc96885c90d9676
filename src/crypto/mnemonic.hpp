#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace kasstamp::crypto {

// Canonicalize a mnemonic sentence: ASCII letters only, lowercased, words
// joined by single spaces, 12/15/18/21/24 words. The word list itself is
// not consulted; the sentence is whatever the user's wallet produced.
// Returns false with a reason in `error` on malformed input.
bool NormalizeMnemonic(std::string_view sentence, std::string* normalized,
                       std::string* error = nullptr);

// 64-byte BIP39 seed:
//   seed = PBKDF2-HMAC-SHA512(sentence, "mnemonic" + passphrase, 2048, 64)
// `sentence` must already be normalized.
std::array<std::uint8_t, 64> MnemonicSeedFromSentence(const std::string& sentence,
                                                      const std::string& passphrase);

}  // namespace kasstamp::crypto
