#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace kasstamp::wallet {

class KeyValueStorage {
 public:
  virtual ~KeyValueStorage() = default;

  virtual std::optional<std::string> GetItem(const std::string& key) = 0;
  virtual void SetItem(const std::string& key, const std::string& value) = 0;
  virtual void RemoveItem(const std::string& key) = 0;
};

class MemoryStorage final : public KeyValueStorage {
 public:
  std::optional<std::string> GetItem(const std::string& key) override;
  void SetItem(const std::string& key, const std::string& value) override;
  void RemoveItem(const std::string& key) override;

 private:
  std::map<std::string, std::string> items_;
};

// One file per key inside a directory. Writes replace the file atomically and
// are created owner-readable only.
class DirectoryStorage final : public KeyValueStorage {
 public:
  explicit DirectoryStorage(std::filesystem::path directory);

  std::optional<std::string> GetItem(const std::string& key) override;
  void SetItem(const std::string& key, const std::string& value) override;
  void RemoveItem(const std::string& key) override;

  const std::filesystem::path& directory() const noexcept { return directory_; }

 private:
  std::filesystem::path PathFor(const std::string& key) const;

  std::filesystem::path directory_;
};

}  // namespace kasstamp::wallet
