#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace kasstamp::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);

// Accepts debug/info/warn/warning/error (case-insensitive). Throws
// std::runtime_error on anything else.
LogLevel ParseLogLevelString(const std::string& value);

// Local wall-clock time as "YYYY-MM-DD HH:MM:SS".
std::string FormatTimestamp();

// Process-wide logger. Lines are "[timestamp] [LEVEL] message". With a file
// sink enabled every line at or above the threshold goes to the file, which
// rotates to path.1 .. path.N once it reaches the size limit. Without a file
// sink, warn and error lines go to stderr.
class DebugLogger {
 public:
  void Enable(const std::string& path);
  void Disable();
  void Configure(LogLevel level, std::uintmax_t max_bytes, std::size_t max_files);
  void Log(LogLevel level, const std::string& message);
  bool Enabled() const;
  LogLevel Threshold() const;

 private:
  void RotateLocked();

  mutable std::mutex mutex_;
  std::ofstream stream_;
  std::string path_;
  LogLevel level_threshold_{LogLevel::kInfo};
  std::uintmax_t max_bytes_{0};
  std::size_t max_files_{0};
  std::uintmax_t current_size_{0};
};

DebugLogger& GlobalLogger();

void LogDebug(const std::string& message);
void LogInfo(const std::string& message);
void LogWarn(const std::string& message);
void LogError(const std::string& message);

}  // namespace kasstamp::util
