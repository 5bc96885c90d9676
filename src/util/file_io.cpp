#include "util/file_io.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <system_error>

namespace kasstamp::util {

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

std::filesystem::path MakeTempPath(const std::filesystem::path& target) {
  const auto nonce = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  return target.parent_path() /
         (target.filename().string() + ".tmp." + std::to_string(now) + "." +
          std::to_string(nonce));
}

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

}  // namespace

bool AtomicWriteFile(const std::filesystem::path& path,
                     std::span<const std::uint8_t> data,
                     bool private_file,
                     std::string* error) {
  const auto parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      if (error) *error = "create_directories failed: " + ec.message();
      return false;
    }
  }

  const auto tmp_path = MakeTempPath(path);
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      if (error) *error = "failed to open temp file for write: " + tmp_path.string();
      return false;
    }
    if (!data.empty()) {
      out.write(reinterpret_cast<const char*>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    out.flush();
    if (!out.good()) {
      out.close();
      RemoveQuietly(tmp_path);
      if (error) *error = "write failed: " + tmp_path.string();
      return false;
    }
  }
  if (private_file) {
    std::error_code ec;
    std::filesystem::permissions(
        tmp_path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
        std::filesystem::perm_options::replace, ec);
    if (ec) {
      RemoveQuietly(tmp_path);
      if (error) *error = "failed to restrict permissions: " + ec.message();
      return false;
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    RemoveQuietly(tmp_path);
    if (error) *error = "rename failed: " + ec.message();
    return false;
  }
  return true;
}

bool AtomicWriteText(const std::filesystem::path& path, std::string_view text,
                     bool private_file, std::string* error) {
  return AtomicWriteFile(
      path,
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()),
                                    text.size()),
      private_file, error);
}

bool ReadFileBytes(const std::filesystem::path& path, std::size_t max_bytes,
                   std::vector<std::uint8_t>* out, std::string* error) {
  out->clear();
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    if (error) *error = "file not found or unreadable: " + path.string();
    return false;
  }
  in.seekg(0, std::ios::end);
  const auto size = in.tellg();
  if (size < 0) {
    if (error) *error = "failed to size file: " + path.string();
    return false;
  }
  if (static_cast<std::uint64_t>(size) > max_bytes) {
    if (error) *error = "file too large: " + path.string();
    return false;
  }
  in.seekg(0, std::ios::beg);
  out->resize(static_cast<std::size_t>(size));
  if (!out->empty()) {
    in.read(reinterpret_cast<char*>(out->data()), static_cast<std::streamsize>(out->size()));
  }
  if (!in.good() && !(in.eof() && in.gcount() == static_cast<std::streamsize>(out->size()))) {
    out->clear();
    if (error) *error = "file read failed: " + path.string();
    return false;
  }
  return true;
}

bool ReadFileText(const std::filesystem::path& path, std::size_t max_bytes,
                  std::string* out, std::string* error) {
  std::vector<std::uint8_t> bytes;
  if (!ReadFileBytes(path, max_bytes, &bytes, error)) {
    out->clear();
    return false;
  }
  out->assign(bytes.begin(), bytes.end());
  return true;
}

}  // namespace kasstamp::util
