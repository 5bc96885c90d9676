#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "util/aead.hpp"
#include "util/base64.hpp"
#include "util/csprng.hpp"
#include "util/error.hpp"
#include "util/gzip.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"
#include "util/time_format.hpp"

using namespace kasstamp::util;

int main() {
  try {
    {
      const std::vector<std::uint8_t> bytes{0x00, 0xab, 0xff};
      if (HexEncode(bytes) != "00abff") {
        std::cerr << "HexEncode produced " << HexEncode(bytes) << "\n";
        return EXIT_FAILURE;
      }
      std::vector<std::uint8_t> decoded;
      if (!HexDecode("00ABff", &decoded) || decoded != bytes) {
        std::cerr << "HexDecode rejected mixed-case hex\n";
        return EXIT_FAILURE;
      }
      if (HexDecode("abc", &decoded) || !decoded.empty()) {
        std::cerr << "odd-length hex accepted\n";
        return EXIT_FAILURE;
      }
      if (HexDecode("0g", &decoded)) {
        std::cerr << "non-hex digit accepted\n";
        return EXIT_FAILURE;
      }
      if (StripHexDecorations(" 0xAB cd\n") != "ABcd") {
        std::cerr << "StripHexDecorations kept decorations\n";
        return EXIT_FAILURE;
      }
    }

    {
      const std::string text = "hello";
      const std::vector<std::uint8_t> bytes(text.begin(), text.end());
      if (Base64Encode(bytes) != "aGVsbG8=") {
        std::cerr << "Base64Encode produced " << Base64Encode(bytes) << "\n";
        return EXIT_FAILURE;
      }
      std::vector<std::uint8_t> decoded;
      if (!Base64Decode("aGVs\nbG8=", &decoded) || decoded != bytes) {
        std::cerr << "Base64Decode failed on wrapped input\n";
        return EXIT_FAILURE;
      }
      if (Base64Decode("aGVsbG8=aa", &decoded)) {
        std::cerr << "data after padding accepted\n";
        return EXIT_FAILURE;
      }
      if (Base64Decode("aGV*bG8=", &decoded)) {
        std::cerr << "character outside the alphabet accepted\n";
        return EXIT_FAILURE;
      }
    }

    {
      const std::vector<std::uint8_t> input(10000, 'a');
      std::vector<std::uint8_t> compressed;
      std::string error;
      if (!GzipCompress(input, &compressed, &error)) {
        std::cerr << "GzipCompress failed: " << error << "\n";
        return EXIT_FAILURE;
      }
      if (compressed.size() < 2 || compressed[0] != 0x1f || compressed[1] != 0x8b ||
          compressed.size() >= input.size()) {
        std::cerr << "compressed output is not a small gzip member\n";
        return EXIT_FAILURE;
      }
      std::vector<std::uint8_t> restored;
      if (!GzipDecompress(compressed, &restored, input.size(), &error) || restored != input) {
        std::cerr << "GzipDecompress did not restore the input: " << error << "\n";
        return EXIT_FAILURE;
      }
      if (GzipDecompress(compressed, &restored, 100, &error)) {
        std::cerr << "GzipDecompress ignored the output limit\n";
        return EXIT_FAILURE;
      }
      const std::vector<std::uint8_t> garbage{1, 2, 3, 4, 5};
      if (GzipDecompress(garbage, &restored, 1000, &error)) {
        std::cerr << "GzipDecompress accepted garbage\n";
        return EXIT_FAILURE;
      }
    }

    {
      const auto key = SecureRandomBytes(kAes256GcmKeySize);
      const auto nonce = SecureRandomBytes(kAes256GcmNonceSize);
      const std::vector<std::uint8_t> aad{'g', 'r', 'o', 'u', 'p'};
      const std::vector<std::uint8_t> plaintext{1, 2, 3, 4, 5, 6, 7, 8};
      auto sealed = Aes256GcmEncrypt(key, nonce, aad, plaintext);
      if (sealed.size() != plaintext.size() + kAes256GcmTagSize) {
        std::cerr << "unexpected AES-GCM output size " << sealed.size() << "\n";
        return EXIT_FAILURE;
      }
      std::vector<std::uint8_t> opened;
      if (!Aes256GcmDecrypt(key, nonce, aad, sealed, &opened) || opened != plaintext) {
        std::cerr << "AES-GCM round trip failed\n";
        return EXIT_FAILURE;
      }
      const std::vector<std::uint8_t> other_aad{'o', 't', 'h', 'e', 'r'};
      if (Aes256GcmDecrypt(key, nonce, other_aad, sealed, &opened)) {
        std::cerr << "AES-GCM accepted a different AAD\n";
        return EXIT_FAILURE;
      }
      sealed[0] ^= 0x01;
      if (Aes256GcmDecrypt(key, nonce, aad, sealed, &opened) || !opened.empty()) {
        std::cerr << "AES-GCM accepted tampered ciphertext\n";
        return EXIT_FAILURE;
      }
      bool threw = false;
      try {
        Aes256GcmEncrypt(std::vector<std::uint8_t>(16, 0), nonce, aad, plaintext);
      } catch (const StampError& e) {
        threw = e.code() == ErrorCode::kCryptoFailure;
      }
      if (!threw) {
        std::cerr << "short AES key was not rejected\n";
        return EXIT_FAILURE;
      }
    }

    {
      const auto uuid = RandomUuidV4();
      if (uuid.size() != 36 || uuid[14] != '4' || uuid[8] != '-' || uuid == RandomUuidV4()) {
        std::cerr << "RandomUuidV4 produced " << uuid << "\n";
        return EXIT_FAILURE;
      }
    }

    {
      const std::chrono::system_clock::time_point when{std::chrono::milliseconds(1500)};
      if (FormatIso8601Utc(when) != "1970-01-01T00:00:01.500Z") {
        std::cerr << "FormatIso8601Utc produced " << FormatIso8601Utc(when) << "\n";
        return EXIT_FAILURE;
      }
      const auto parsed = ParseIso8601("2024-02-29T12:30:00.250+02:00");
      const auto expected = ParseIso8601("2024-02-29T10:30:00.250Z");
      if (!parsed || !expected || *parsed != *expected) {
        std::cerr << "ParseIso8601 mishandled an offset\n";
        return EXIT_FAILURE;
      }
      if (ParseIso8601("2023-02-29T00:00:00Z") || ParseIso8601("yesterday")) {
        std::cerr << "ParseIso8601 accepted an invalid date\n";
        return EXIT_FAILURE;
      }
    }

    {
      const auto dir = std::filesystem::temp_directory_path() / ("kasstamp-log-" + RandomUuidV4());
      const auto path = (dir / "debug.log").string();
      auto& logger = GlobalLogger();
      logger.Configure(LogLevel::kDebug, 256, 2);
      logger.Enable(path);
      for (int i = 0; i < 20; ++i) {
        LogInfo("rotation line " + std::to_string(i));
      }
      logger.Disable();
      if (!std::filesystem::exists(path + ".1")) {
        std::cerr << "debug log did not rotate\n";
        return EXIT_FAILURE;
      }
      if (std::filesystem::exists(path + ".3")) {
        std::cerr << "debug log kept more files than configured\n";
        return EXIT_FAILURE;
      }
      std::filesystem::remove_all(dir);
      if (ParseLogLevelString("WARNING") != LogLevel::kWarn) {
        std::cerr << "ParseLogLevelString is case sensitive\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "encoding_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }

  std::cout << "encoding_tests: OK\n";
  return 0;
}
