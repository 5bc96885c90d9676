#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kasstamp::util {

// Atomically replace `path`: the bytes go to a temp file in the same
// directory, which is then renamed over the target. Parent directories are
// created as needed. Owner-only permissions are applied when `private_file`.
bool AtomicWriteFile(const std::filesystem::path& path,
                     std::span<const std::uint8_t> data,
                     bool private_file,
                     std::string* error = nullptr);

bool AtomicWriteText(const std::filesystem::path& path, std::string_view text,
                     bool private_file, std::string* error = nullptr);

// Reads a whole file. Fails when it is larger than `max_bytes`.
bool ReadFileBytes(const std::filesystem::path& path, std::size_t max_bytes,
                   std::vector<std::uint8_t>* out, std::string* error = nullptr);

bool ReadFileText(const std::filesystem::path& path, std::size_t max_bytes,
                  std::string* out, std::string* error = nullptr);

}  // namespace kasstamp::util
