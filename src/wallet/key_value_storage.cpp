#include "wallet/key_value_storage.hpp"

#include <cctype>
#include <system_error>

#include "util/error.hpp"
#include "util/file_io.hpp"

namespace kasstamp::wallet {

namespace {

constexpr std::size_t kMaxItemBytes = 16 * 1024 * 1024;

bool IsSafeKey(const std::string& key) {
  if (key.empty() || key.size() > 200 || key.front() == '.') {
    return false;
  }
  for (char c : key) {
    const auto uc = static_cast<unsigned char>(c);
    if (!std::isalnum(uc) && c != '.' && c != '-' && c != '_') {
      return false;
    }
  }
  return true;
}

}  // namespace

std::optional<std::string> MemoryStorage::GetItem(const std::string& key) {
  const auto it = items_.find(key);
  if (it == items_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryStorage::SetItem(const std::string& key, const std::string& value) {
  items_[key] = value;
}

void MemoryStorage::RemoveItem(const std::string& key) { items_.erase(key); }

DirectoryStorage::DirectoryStorage(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path DirectoryStorage::PathFor(const std::string& key) const {
  if (!IsSafeKey(key)) {
    util::Fail(util::ErrorCode::kInvalidArgument, "storage key '" + key + "' is not a safe file name");
  }
  return directory_ / key;
}

std::optional<std::string> DirectoryStorage::GetItem(const std::string& key) {
  const auto path = PathFor(key);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }
  std::string text;
  std::string error;
  if (!util::ReadFileText(path, kMaxItemBytes, &text, &error)) {
    util::Fail(util::ErrorCode::kStorageFailure, "failed to read " + path.string() + ": " + error);
  }
  return text;
}

void DirectoryStorage::SetItem(const std::string& key, const std::string& value) {
  const auto path = PathFor(key);
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    util::Fail(util::ErrorCode::kStorageFailure,
               "failed to create " + directory_.string() + ": " + ec.message());
  }
  std::string error;
  if (!util::AtomicWriteText(path, value, /*private_file=*/true, &error)) {
    util::Fail(util::ErrorCode::kStorageFailure, "failed to write " + path.string() + ": " + error);
  }
}

void DirectoryStorage::RemoveItem(const std::string& key) {
  const auto path = PathFor(key);
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    util::Fail(util::ErrorCode::kStorageFailure, "failed to remove " + path.string() + ": " + ec.message());
  }
}

}  // namespace kasstamp::wallet
