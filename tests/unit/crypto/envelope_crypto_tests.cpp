#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "crypto/envelope_crypto.hpp"
#include "util/error.hpp"

using namespace kasstamp::crypto;
using kasstamp::util::ErrorCode;
using kasstamp::util::StampError;

namespace {

template <typename Fn>
bool ThrowsCode(Fn&& fn, ErrorCode code) {
  try {
    fn();
  } catch (const StampError& e) {
    return e.code() == code;
  }
  return false;
}

}  // namespace

int main() {
  try {
    std::vector<std::uint8_t> private_key(32);
    for (std::size_t i = 0; i < private_key.size(); ++i) {
      private_key[i] = static_cast<std::uint8_t>(0xA0 + i);
    }
    const std::string text = "the quick brown fox";
    const std::vector<std::uint8_t> plaintext(text.begin(), text.end());

    const auto key = DeriveEnvelopeKey(private_key, "group-a");
    const auto sealed = EncryptEnvelope(plaintext, key);
    if (sealed.size() != plaintext.size() + kEnvelopeOverhead) {
      std::cerr << "sealed size " << sealed.size() << " lacks the nonce and tag\n";
      return EXIT_FAILURE;
    }
    if (DecryptEnvelope(sealed, key) != plaintext) {
      std::cerr << "envelope round trip failed\n";
      return EXIT_FAILURE;
    }

    // Fresh nonces: two seals of the same plaintext differ.
    if (EncryptEnvelope(plaintext, key) == sealed) {
      std::cerr << "nonce reused across encryptions\n";
      return EXIT_FAILURE;
    }

    // Same key material and salt derive the same key.
    const auto again = DeriveEnvelopeKey(private_key, "group-a");
    if (DecryptEnvelope(sealed, again) != plaintext) {
      std::cerr << "key derivation is not deterministic\n";
      return EXIT_FAILURE;
    }

    const auto other_group = DeriveEnvelopeKey(private_key, "group-b");
    if (!ThrowsCode([&] { DecryptEnvelope(sealed, other_group); },
                    ErrorCode::kAuthenticationFailed)) {
      std::cerr << "key for another group opened the envelope\n";
      return EXIT_FAILURE;
    }

    // Every byte is covered: nonce, body and tag.
    for (std::size_t i = 0; i < sealed.size(); ++i) {
      auto tampered = sealed;
      tampered[i] ^= 0x01;
      if (!ThrowsCode([&] { DecryptEnvelope(tampered, key); },
                      ErrorCode::kAuthenticationFailed)) {
        std::cerr << "envelope with byte " << i << " flipped accepted\n";
        return EXIT_FAILURE;
      }
    }

    auto truncated = sealed;
    truncated.pop_back();
    if (!ThrowsCode([&] { DecryptEnvelope(truncated, key); }, ErrorCode::kAuthenticationFailed)) {
      std::cerr << "truncated envelope accepted\n";
      return EXIT_FAILURE;
    }

    const std::vector<std::uint8_t> short_blob(kEnvelopeOverhead - 1, 0);
    if (!ThrowsCode([&] { DecryptEnvelope(short_blob, key); }, ErrorCode::kCiphertextTooShort)) {
      std::cerr << "short blob not reported as too short\n";
      return EXIT_FAILURE;
    }

    // An empty plaintext still carries nonce and tag.
    const auto empty_sealed = EncryptEnvelope({}, key);
    if (empty_sealed.size() != kEnvelopeOverhead || !DecryptEnvelope(empty_sealed, key).empty()) {
      std::cerr << "empty plaintext round trip failed\n";
      return EXIT_FAILURE;
    }

    if (!ThrowsCode([&] { DeriveEnvelopeKey(private_key, ""); }, ErrorCode::kInvalidArgument) ||
        !ThrowsCode([&] { DeriveEnvelopeKey(std::vector<std::uint8_t>(31, 1), "g"); },
                    ErrorCode::kInvalidArgument)) {
      std::cerr << "bad key derivation input accepted\n";
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "envelope_crypto_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }

  std::cout << "envelope_crypto_tests: OK\n";
  return 0;
}
