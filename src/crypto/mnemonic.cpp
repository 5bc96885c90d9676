#include "crypto/mnemonic.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include "util/pbkdf2.hpp"
#include "util/secure_wipe.hpp"

namespace kasstamp::crypto {

namespace {

bool IsSpace(char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

bool IsAllowedWordCount(std::size_t count) {
  return count == 12 || count == 15 || count == 18 || count == 21 || count == 24;
}

}  // namespace

bool NormalizeMnemonic(std::string_view sentence, std::string* normalized, std::string* error) {
  normalized->clear();
  std::size_t word_count = 0;
  std::size_t pos = 0;
  while (pos < sentence.size()) {
    while (pos < sentence.size() && IsSpace(sentence[pos])) {
      ++pos;
    }
    if (pos >= sentence.size()) {
      break;
    }
    if (word_count > 0) {
      normalized->push_back(' ');
    }
    while (pos < sentence.size() && !IsSpace(sentence[pos])) {
      const auto ch = static_cast<unsigned char>(sentence[pos]);
      if (std::isalpha(ch) == 0) {
        util::SecureWipe(*normalized);
        if (error) {
          *error = "mnemonic words must contain ASCII letters only";
        }
        return false;
      }
      normalized->push_back(static_cast<char>(std::tolower(ch)));
      ++pos;
    }
    ++word_count;
  }
  if (word_count == 0) {
    if (error) {
      *error = "mnemonic is empty";
    }
    return false;
  }
  if (!IsAllowedWordCount(word_count)) {
    util::SecureWipe(*normalized);
    if (error) {
      *error = "mnemonic must contain 12, 15, 18, 21 or 24 words (got " +
               std::to_string(word_count) + ")";
    }
    return false;
  }
  return true;
}

std::array<std::uint8_t, 64> MnemonicSeedFromSentence(const std::string& sentence,
                                                      const std::string& passphrase) {
  // salt = "mnemonic" + passphrase (UTF-8, no NUL terminator).
  std::string salt = "mnemonic";
  salt.append(passphrase);
  const auto salt_bytes = std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(salt.data()), salt.size());

  auto seed_vec = util::Pbkdf2HmacSha512(sentence, salt_bytes, 2048u, 64u);

  std::array<std::uint8_t, 64> seed{};
  std::copy_n(seed_vec.begin(), seed.size(), seed.begin());
  util::SecureWipe(seed_vec);
  util::SecureWipe(salt);
  return seed;
}

}  // namespace kasstamp::crypto
