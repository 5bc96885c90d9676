#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "crypto/hash.hpp"
#include "payload/chunk_splitter.hpp"
#include "util/error.hpp"

using kasstamp::payload::Chunk;
using kasstamp::payload::JoinChunks;
using kasstamp::payload::SplitIntoChunks;
using kasstamp::payload::SplitOptions;
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

std::vector<std::uint8_t> Pattern(std::size_t size) {
  std::vector<std::uint8_t> out(size);
  for (std::size_t i = 0; i < size; ++i) {
    out[i] = static_cast<std::uint8_t>((i * 31 + 7) & 0xFF);
  }
  return out;
}

}  // namespace

int main() {
  try {
    {
      // Data that fits stays a single chunk carrying the whole digest.
      const std::string text = "abc";
      const std::vector<std::uint8_t> data(text.begin(), text.end());
      SplitOptions options;
      options.chunk_size = 3;
      options.group_id = "group-1";
      const auto chunks = SplitIntoChunks(data, options);
      if (chunks.size() != 1 || chunks[0].total != 1 || chunks[0].group_id != "group-1" ||
          chunks[0].digest !=
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad") {
        std::cerr << "single chunk split is wrong\n";
        return EXIT_FAILURE;
      }
    }

    {
      const auto data = Pattern(10001);
      SplitOptions options;
      options.chunk_size = 1000;
      auto chunks = SplitIntoChunks(data, options);
      if (chunks.size() != 11 || chunks.back().data.size() != 1) {
        std::cerr << "expected 11 chunks with a 1-byte tail, got " << chunks.size() << "\n";
        return EXIT_FAILURE;
      }
      for (std::size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].index != i || chunks[i].total != 11 ||
            chunks[i].group_id != chunks[0].group_id ||
            chunks[i].digest != kasstamp::crypto::Sha256Hex(chunks[i].data)) {
          std::cerr << "chunk " << i << " has inconsistent fields\n";
          return EXIT_FAILURE;
        }
      }
      if (chunks[0].group_id.size() != 36) {
        std::cerr << "default group id is not a UUID: " << chunks[0].group_id << "\n";
        return EXIT_FAILURE;
      }
      // Join accepts any order.
      std::reverse(chunks.begin(), chunks.end());
      if (JoinChunks(chunks) != data) {
        std::cerr << "join after reverse did not restore the data\n";
        return EXIT_FAILURE;
      }
    }

    {
      // min_chunks pads with empty trailing chunks.
      const auto data = Pattern(10);
      SplitOptions options;
      options.chunk_size = 100;
      options.min_chunks = 3;
      const auto chunks = SplitIntoChunks(data, options);
      if (chunks.size() != 3 || chunks[0].data.size() != 10 || !chunks[1].data.empty() ||
          !chunks[2].data.empty()) {
        std::cerr << "min_chunks padding is wrong\n";
        return EXIT_FAILURE;
      }
      if (JoinChunks(chunks) != data) {
        std::cerr << "join with empty chunks failed\n";
        return EXIT_FAILURE;
      }
    }

    {
      const std::vector<std::uint8_t> empty;
      const auto chunks = SplitIntoChunks(empty);
      if (chunks.size() != 1 || !chunks[0].data.empty() ||
          chunks[0].digest !=
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855") {
        std::cerr << "empty input must give one empty chunk\n";
        return EXIT_FAILURE;
      }
    }

    {
      const auto data = Pattern(50);
      SplitOptions options;
      options.chunk_size = 0;
      if (!ThrowsCode([&] { SplitIntoChunks(data, options); }, ErrorCode::kInvalidArgument)) {
        std::cerr << "zero chunk size accepted\n";
        return EXIT_FAILURE;
      }
      options.chunk_size = 10;
      options.min_chunks = 0;
      if (!ThrowsCode([&] { SplitIntoChunks(data, options); }, ErrorCode::kInvalidArgument)) {
        std::cerr << "zero min_chunks accepted\n";
        return EXIT_FAILURE;
      }
    }

    {
      const auto data = Pattern(50);
      SplitOptions options;
      options.chunk_size = 10;
      const auto chunks = SplitIntoChunks(data, options);

      auto missing = chunks;
      missing.erase(missing.begin() + 2);
      if (!ThrowsCode([&] { JoinChunks(missing); }, ErrorCode::kInvalidArgument)) {
        std::cerr << "join with a missing index accepted\n";
        return EXIT_FAILURE;
      }

      auto duplicated = chunks;
      duplicated[3] = duplicated[2];
      if (!ThrowsCode([&] { JoinChunks(duplicated); }, ErrorCode::kInvalidArgument)) {
        std::cerr << "join with a duplicated index accepted\n";
        return EXIT_FAILURE;
      }

      auto mixed = chunks;
      mixed[1].group_id = "other";
      if (!ThrowsCode([&] { JoinChunks(mixed); }, ErrorCode::kInvalidArgument)) {
        std::cerr << "join across groups accepted\n";
        return EXIT_FAILURE;
      }

      auto tampered = chunks;
      tampered[4].data[0] ^= 0x01;
      if (!ThrowsCode([&] { JoinChunks(tampered); }, ErrorCode::kDigestMismatch)) {
        std::cerr << "join with tampered bytes accepted\n";
        return EXIT_FAILURE;
      }

      if (!ThrowsCode([] { JoinChunks({}); }, ErrorCode::kInvalidArgument)) {
        std::cerr << "join of nothing accepted\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "chunk_splitter_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }

  std::cout << "chunk_splitter_tests: OK\n";
  return 0;
}
