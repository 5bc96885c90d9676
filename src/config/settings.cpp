#include "config/settings.hpp"

#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string_view>

#include "config/network.hpp"
#include "util/error.hpp"
#include "util/logging.hpp"

namespace kasstamp::config {

namespace {

struct EnvBinding {
  std::string_view variable;
  std::string_view key;
};

constexpr std::array<EnvBinding, 14> kEnvBindings{{
    {"KASSTAMP_NETWORK", "network"},
    {"KASSTAMP_DATA_DIR", "datadir"},
    {"KASSTAMP_WALLET_ID", "walletid"},
    {"KASSTAMP_CHUNK_SIZE", "chunksize"},
    {"KASSTAMP_COMPRESS", "compress"},
    {"KASSTAMP_AUTO_LOCK_MINUTES", "autolockminutes"},
    {"KASSTAMP_PRIORITY_FEE", "priorityfee"},
    {"KASSTAMP_ARGON2_T", "argon2t"},
    {"KASSTAMP_ARGON2_M", "argon2m"},
    {"KASSTAMP_ARGON2_P", "argon2p"},
    {"KASSTAMP_LOG_LEVEL", "loglevel"},
    {"KASSTAMP_DEBUG_LOG", "debuglog"},
    {"KASSTAMP_LOG_MAX_SIZE_MB", "logmaxsizemb"},
    {"KASSTAMP_LOG_MAX_FILES", "logmaxfiles"},
}};

constexpr std::array<std::string_view, 20> kSettingKeys{{
    "network",    "datadir",   "walletid",        "wallet",   "chunksize",
    "compress",   "compression", "nocompress",    "autolockminutes", "autolock",
    "priorityfee", "argon2t",  "argon2m",         "argon2p",  "loglevel",
    "debuglog",   "logmaxsizemb", "logmaxfiles",  "config",   "conf",
}};

bool IsSettingKey(const std::string& normalized) {
  for (const auto key : kSettingKeys) {
    if (key == normalized) {
      return true;
    }
  }
  return false;
}

std::string Trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

std::optional<std::string> GetEnvValue(std::string_view name) {
  std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::uint64_t ParseUnsigned(const std::string& key, const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    util::Fail(util::ErrorCode::kInvalidArgument,
               "invalid value for " + key + ": '" + value + "' is not a non-negative integer");
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    util::Fail(util::ErrorCode::kInvalidArgument, "value for " + key + " is out of range");
  }
}

std::uint32_t ParseU32(const std::string& key, const std::string& value) {
  const auto parsed = ParseUnsigned(key, value);
  if (parsed > 0xFFFFFFFFULL) {
    util::Fail(util::ErrorCode::kInvalidArgument, "value for " + key + " is out of range");
  }
  return static_cast<std::uint32_t>(parsed);
}

}  // namespace

std::string NormalizeKey(std::string key) {
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    if (c == '-' || c == '_') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool ParseBool(const std::string& value) {
  std::string lower;
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  util::Fail(util::ErrorCode::kInvalidArgument, "invalid boolean value: " + value);
}

bool ApplySetting(const std::string& raw_key, const std::string& value, Settings* settings) {
  const std::string key = NormalizeKey(raw_key);
  if (key == "network") {
    if (!ParseNetwork(value)) {
      util::Fail(util::ErrorCode::kInvalidArgument, "unknown network '" + value + "'");
    }
    settings->network = value;
  } else if (key == "datadir") {
    settings->data_dir = value;
  } else if (key == "walletid" || key == "wallet") {
    settings->wallet_id = value;
  } else if (key == "chunksize") {
    const auto size = ParseUnsigned(raw_key, value);
    if (size == 0) {
      util::Fail(util::ErrorCode::kInvalidArgument, "chunk size must be positive");
    }
    settings->chunk_size = static_cast<std::size_t>(size);
  } else if (key == "compress" || key == "compression") {
    settings->compress = ParseBool(value);
  } else if (key == "nocompress") {
    settings->compress = !ParseBool(value);
  } else if (key == "autolockminutes" || key == "autolock") {
    settings->auto_lock_minutes = ParseU32(raw_key, value);
  } else if (key == "priorityfee") {
    settings->priority_fee = ParseUnsigned(raw_key, value);
  } else if (key == "argon2t") {
    settings->argon2.t_cost = ParseU32(raw_key, value);
  } else if (key == "argon2m") {
    settings->argon2.m_cost_kib = ParseU32(raw_key, value);
  } else if (key == "argon2p") {
    settings->argon2.parallelism = ParseU32(raw_key, value);
  } else if (key == "loglevel") {
    try {
      util::ParseLogLevelString(value);
    } catch (const std::runtime_error& e) {
      util::Fail(util::ErrorCode::kInvalidArgument, e.what());
    }
    settings->log_level = value;
  } else if (key == "debuglog") {
    settings->debug_log_path = value;
  } else if (key == "logmaxsizemb") {
    settings->log_max_size_mb = static_cast<std::size_t>(ParseUnsigned(raw_key, value));
  } else if (key == "logmaxfiles") {
    settings->log_max_files = static_cast<std::size_t>(ParseUnsigned(raw_key, value));
  } else if (key == "config" || key == "conf") {
    settings->config_path = value;
  } else {
    util::LogWarn("config: unknown key '" + raw_key + "' ignored");
    return false;
  }
  return true;
}

void LoadSettingsFile(const std::filesystem::path& path, Settings* settings) {
  if (path.empty() || !std::filesystem::exists(path)) {
    return;
  }
  std::ifstream in(path);
  if (!in) {
    util::Fail(util::ErrorCode::kStorageFailure, "failed to open config file: " + path.string());
  }
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.resize(comment_pos);
    }
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    std::string key;
    std::string value;
    const auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) {
      key = line;
      value = "1";
    } else {
      key = Trim(line.substr(0, eq_pos));
      value = Trim(line.substr(eq_pos + 1));
      if (value.empty()) {
        value = "1";
      }
    }
    try {
      ApplySetting(key, value, settings);
    } catch (const util::StampError& e) {
      util::Fail(e.code(), path.string() + ":" + std::to_string(lineno) + ": " + e.what());
    }
  }
}

void ApplyEnvironmentOverrides(Settings* settings) {
  for (const auto& binding : kEnvBindings) {
    if (auto value = GetEnvValue(binding.variable)) {
      ApplySetting(std::string(binding.key), *value, settings);
    }
  }
}

void ResolveDefaults(Settings* settings) {
  if (!settings->data_dir.empty()) {
    return;
  }
  std::filesystem::path base;
  if (auto xdg_data = GetEnvValue("XDG_DATA_HOME")) {
    base = std::filesystem::path(*xdg_data) / "kasstamp";
  } else if (auto home = GetEnvValue("HOME")) {
    base = std::filesystem::path(*home) / ".kasstamp";
  } else {
    base = std::filesystem::path("data");
  }
  settings->data_dir = (base / settings->network).string();
}

Settings LoadSettings(std::vector<std::string>* args) {
  Settings settings;
  std::vector<std::pair<std::string, std::string>> overrides;
  std::vector<std::string> rest;
  bool options_done = false;
  for (auto& arg : *args) {
    if (!options_done && arg == "--") {
      options_done = true;
      continue;
    }
    if (options_done || arg.rfind("--", 0) != 0) {
      rest.push_back(std::move(arg));
      continue;
    }
    const auto eq_pos = arg.find('=');
    std::string key = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);
    std::string value = eq_pos == std::string::npos ? "1" : arg.substr(eq_pos + 1);
    // Command-specific flags (--password-stdin, --private, ...) stay with
    // the command.
    if (!IsSettingKey(NormalizeKey(key))) {
      rest.push_back(std::move(arg));
      continue;
    }
    overrides.emplace_back(std::move(key), std::move(value));
  }
  *args = std::move(rest);

  for (const auto& [key, value] : overrides) {
    const auto normalized = NormalizeKey(key);
    if (normalized == "config" || normalized == "conf") {
      settings.config_path = value;
    }
  }
  if (settings.config_path.empty()) {
    if (auto env = GetEnvValue("KASSTAMP_CONFIG")) {
      settings.config_path = *env;
    }
  }
  LoadSettingsFile(settings.config_path.empty() ? std::filesystem::path("kasstamp.conf")
                                                : std::filesystem::path(settings.config_path),
                   &settings);
  ApplyEnvironmentOverrides(&settings);
  for (const auto& [key, value] : overrides) {
    ApplySetting(key, value, &settings);
  }
  ResolveDefaults(&settings);
  return settings;
}

}  // namespace kasstamp::config
