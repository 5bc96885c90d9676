#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "primitives/amount.hpp"
#include "util/argon2_kdf.hpp"

namespace kasstamp::config {

struct Settings {
  std::string network{"mainnet"};
  // Empty until ResolveDefaults picks a per-network directory.
  std::string data_dir;
  std::string wallet_id{"default"};
  std::size_t chunk_size{20000};
  bool compress{true};
  // Zero disables auto-lock.
  std::uint32_t auto_lock_minutes{30};
  primitives::Amount priority_fee{0};
  util::Argon2idParams argon2{util::DefaultArgon2idParams()};
  std::string log_level{"info"};
  std::string debug_log_path;
  std::size_t log_max_size_mb{10};
  std::size_t log_max_files{5};
  std::string config_path;
};

// Lowercases and drops '-' and '_', so "data-dir", "DATA_DIR" and "datadir"
// name the same setting.
std::string NormalizeKey(std::string key);

bool ParseBool(const std::string& value);

// Applies one setting. Unknown keys are reported through the logger and
// ignored; malformed values throw StampError(kInvalidArgument).
// Returns false for an unknown key.
bool ApplySetting(const std::string& raw_key, const std::string& value, Settings* settings);

// Reads "key = value" lines; '#' starts a comment and a bare key means "1".
// A missing file is not an error.
void LoadSettingsFile(const std::filesystem::path& path, Settings* settings);

// KASSTAMP_NETWORK, KASSTAMP_DATA_DIR, KASSTAMP_LOG_LEVEL, ... override the
// file; every setting has a KASSTAMP_<KEY> variable.
void ApplyEnvironmentOverrides(Settings* settings);

// Fills data_dir from $XDG_DATA_HOME or $HOME when unset.
void ResolveDefaults(Settings* settings);

// Order of precedence, lowest first: built-in defaults, config file,
// environment, "--key=value" arguments. Consumed arguments are removed from
// `args`; whatever remains is the command and its operands.
Settings LoadSettings(std::vector<std::string>* args);

}  // namespace kasstamp::config
