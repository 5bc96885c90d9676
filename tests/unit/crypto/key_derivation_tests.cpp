#include <array>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "crypto/address.hpp"
#include "crypto/hd_key.hpp"
#include "crypto/hkdf.hpp"
#include "crypto/mnemonic.hpp"
#include "crypto/schnorr.hpp"
#include "util/hex.hpp"

using namespace kasstamp::crypto;
using kasstamp::util::HexDecode;
using kasstamp::util::HexEncode;

namespace {

std::vector<std::uint8_t> FromHex(const std::string& hex) {
  std::vector<std::uint8_t> out;
  if (!HexDecode(hex, &out)) {
    throw std::runtime_error("bad hex in test vector: " + hex);
  }
  return out;
}

}  // namespace

int main() {
  try {
    {
      std::string normalized;
      std::string error;
      const std::string sentence =
          "  Abandon abandon abandon abandon abandon abandon\tabandon abandon abandon abandon "
          "abandon ABOUT ";
      if (!NormalizeMnemonic(sentence, &normalized, &error)) {
        std::cerr << "NormalizeMnemonic rejected a valid sentence: " << error << "\n";
        return EXIT_FAILURE;
      }
      const auto seed = MnemonicSeedFromSentence(normalized, "TREZOR");
      if (HexEncode(seed) !=
          "c55257c360c07c72029aebc1b53c05ed0362ada38ead3e3e9efa3708e53495531f09a6987599d18264c1"
          "e1c92f2cf141630c7a3c4ab7c81b2f001698e7463b04") {
        std::cerr << "BIP39 seed mismatch: " << HexEncode(seed) << "\n";
        return EXIT_FAILURE;
      }
      if (NormalizeMnemonic("abandon abandon abandon", &normalized, &error)) {
        std::cerr << "three-word mnemonic accepted\n";
        return EXIT_FAILURE;
      }
      if (NormalizeMnemonic("abandon1 abandon abandon abandon abandon abandon abandon abandon "
                            "abandon abandon abandon about",
                            &normalized, &error)) {
        std::cerr << "mnemonic with digits accepted\n";
        return EXIT_FAILURE;
      }
    }

    {
      const auto seed = FromHex("000102030405060708090a0b0c0d0e0f");
      const auto master = ExtendedPrivateKey::FromSeed(seed);
      if (HexEncode(master.secret()) !=
              "e8f32e723decf4051aefac8e2c93c9c5b214313817cdb01a1494b917c8436b35" ||
          HexEncode(master.chain_code()) !=
              "873dff81c02f525623fd1fe5167eac3a55a049de3d314bb42ee227ffed37d508") {
        std::cerr << "BIP32 master key mismatch\n";
        return EXIT_FAILURE;
      }
      const auto child = master.DeriveChild(0 | kHardenedBit);
      if (HexEncode(child.secret()) !=
          "edb2e14f9ee77d26dd93b4ecede8d16ed408ce149b6cd80b0715a2d911a0afea") {
        std::cerr << "BIP32 m/0' mismatch: " << HexEncode(child.secret()) << "\n";
        return EXIT_FAILURE;
      }
      const auto path = DerivationPath(kKaspaCoinType, {3, 7, false});
      if (FormatDerivationPath(path) != "m/44'/111111'/3'/1/7") {
        std::cerr << "derivation path formatted as " << FormatDerivationPath(path) << "\n";
        return EXIT_FAILURE;
      }
    }

    {
      const std::vector<std::uint8_t> ikm(22, 0x0b);
      const auto salt = FromHex("000102030405060708090a0b0c");
      const auto info = FromHex("f0f1f2f3f4f5f6f7f8f9");
      if (HexEncode(HkdfSha256(ikm, salt, info)) !=
          "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf") {
        std::cerr << "HKDF-SHA256 mismatch\n";
        return EXIT_FAILURE;
      }
      // RFC 5869 test case 3: empty salt and info.
      if (HexEncode(HkdfSha256(ikm, {}, {})) !=
          "8da4e775a563c18f715f802a063c5a31b8a11f5c5ee1879ec3454e5f3c738d2d") {
        std::cerr << "HKDF-SHA256 with empty salt mismatch\n";
        return EXIT_FAILURE;
      }
    }

    {
      const auto secret =
          FromHex("0000000000000000000000000000000000000000000000000000000000000003");
      const std::array<std::uint8_t, 32> message{};
      const auto x_only = XOnlyPublicKey(secret);
      if (HexEncode(x_only) != "f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9") {
        std::cerr << "x-only public key mismatch: " << HexEncode(x_only) << "\n";
        return EXIT_FAILURE;
      }
      const auto signature = SchnorrSign(secret, message);
      if (HexEncode(signature) !=
          "e907831f80848d1069a5371b402410364bdf1c5f8307b0084c55f1ce2dca821525f66a4a85ea8b71e482a7"
          "4f382d2ce5ebeee8fdb2172f477df4900d310536c0") {
        std::cerr << "BIP340 signature mismatch: " << HexEncode(signature) << "\n";
        return EXIT_FAILURE;
      }
      if (!SchnorrVerify(x_only, message, signature)) {
        std::cerr << "valid signature rejected\n";
        return EXIT_FAILURE;
      }
      auto forged = signature;
      forged[10] ^= 0x01;
      std::array<std::uint8_t, 32> other_message{};
      other_message[0] = 1;
      if (SchnorrVerify(x_only, message, forged) ||
          SchnorrVerify(x_only, other_message, signature)) {
        std::cerr << "invalid signature accepted\n";
        return EXIT_FAILURE;
      }
    }

    {
      std::array<std::uint8_t, 32> key{};
      for (std::size_t i = 0; i < key.size(); ++i) {
        key[i] = static_cast<std::uint8_t>(i);
      }
      const auto address = AddressFromXOnlyKey("kaspatest", key);
      if (address.rfind("kaspatest:q", 0) != 0) {
        std::cerr << "unexpected address form " << address << "\n";
        return EXIT_FAILURE;
      }
      const auto decoded = DecodeAddress(address);
      if (!decoded || decoded->prefix != "kaspatest" ||
          decoded->version != AddressVersion::kPubKey ||
          decoded->payload != std::vector<std::uint8_t>(key.begin(), key.end())) {
        std::cerr << "address did not decode to its key\n";
        return EXIT_FAILURE;
      }
      const auto script = PayToAddressScript(*decoded);
      if (script.size() != 34 || script.front() != 0x20 || script.back() != 0xac) {
        std::cerr << "pay-to-pubkey script has the wrong shape\n";
        return EXIT_FAILURE;
      }
      auto corrupted = address;
      corrupted.back() = corrupted.back() == 'q' ? 'p' : 'q';
      if (DecodeAddress(corrupted)) {
        std::cerr << "address with a bad checksum accepted\n";
        return EXIT_FAILURE;
      }
      auto relabelled = address;
      relabelled.replace(0, 9, "kaspadev");
      if (DecodeAddress(relabelled)) {
        std::cerr << "address checksum does not cover the prefix\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "key_derivation_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }

  std::cout << "key_derivation_tests: OK\n";
  return 0;
}
