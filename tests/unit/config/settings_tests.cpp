#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "config/network.hpp"
#include "config/settings.hpp"
#include "util/csprng.hpp"
#include "util/error.hpp"

using namespace kasstamp;
using util::ErrorCode;

namespace {

template <typename Fn>
bool ThrowsCode(Fn&& fn, ErrorCode code) {
  try {
    fn();
  } catch (const util::StampError& e) {
    return e.code() == code;
  }
  return false;
}

void ClearEnvironment() {
  for (const char* name :
       {"KASSTAMP_CONFIG", "KASSTAMP_NETWORK", "KASSTAMP_DATA_DIR", "KASSTAMP_WALLET_ID",
        "KASSTAMP_CHUNK_SIZE", "KASSTAMP_COMPRESS", "KASSTAMP_AUTO_LOCK_MINUTES",
        "KASSTAMP_PRIORITY_FEE", "KASSTAMP_LOG_LEVEL", "XDG_DATA_HOME"}) {
    ::unsetenv(name);
  }
}

}  // namespace

int main() {
  try {
    ClearEnvironment();
    const auto dir =
        std::filesystem::temp_directory_path() / ("kasstamp-settings-" + util::RandomUuidV4());
    std::filesystem::create_directories(dir);

    if (config::NormalizeKey("Data-Dir") != "datadir" ||
        config::NormalizeKey("AUTO_LOCK_MINUTES") != "autolockminutes") {
      std::cerr << "key normalization mismatch\n";
      return EXIT_FAILURE;
    }
    if (!config::ParseBool("Yes") || config::ParseBool("off") ||
        !ThrowsCode([] { config::ParseBool("maybe"); }, ErrorCode::kInvalidArgument)) {
      std::cerr << "boolean parsing mismatch\n";
      return EXIT_FAILURE;
    }

    {
      config::Settings settings;
      if (config::ApplySetting("colour", "blue", &settings)) {
        std::cerr << "unknown key reported as applied\n";
        return EXIT_FAILURE;
      }
      if (!ThrowsCode([&] { config::ApplySetting("network", "devnet-7", &settings); },
                      ErrorCode::kInvalidArgument) ||
          !ThrowsCode([&] { config::ApplySetting("chunk-size", "0", &settings); },
                      ErrorCode::kInvalidArgument) ||
          !ThrowsCode([&] { config::ApplySetting("priority_fee", "-5", &settings); },
                      ErrorCode::kInvalidArgument) ||
          !ThrowsCode([&] { config::ApplySetting("log-level", "chatty", &settings); },
                      ErrorCode::kInvalidArgument)) {
        std::cerr << "malformed values accepted\n";
        return EXIT_FAILURE;
      }
      config::ApplySetting("no-compress", "1", &settings);
      if (settings.compress) {
        std::cerr << "no-compress did not disable compression\n";
        return EXIT_FAILURE;
      }
    }

    const auto conf = dir / "kasstamp.conf";
    {
      std::ofstream out(conf);
      out << "# stamping defaults\n"
          << "network = testnet-10\n"
          << "chunk_size = 5000   # small chunks\n"
          << "wallet-id = archive\n"
          << "\n"
          << "priority-fee = 100\n"
          << "compress = false\n";
    }
    {
      config::Settings settings;
      config::LoadSettingsFile(conf, &settings);
      if (settings.network != "testnet-10" || settings.chunk_size != 5000 ||
          settings.wallet_id != "archive" || settings.priority_fee != 100 || settings.compress) {
        std::cerr << "config file values not applied\n";
        return EXIT_FAILURE;
      }
      config::Settings untouched;
      config::LoadSettingsFile(dir / "missing.conf", &untouched);
      if (untouched.network != "mainnet") {
        std::cerr << "missing config file changed settings\n";
        return EXIT_FAILURE;
      }
    }

    const auto broken = dir / "broken.conf";
    {
      std::ofstream out(broken);
      out << "network = mainnet\nchunk-size = lots\n";
    }
    bool line_reported = false;
    try {
      config::Settings settings;
      config::LoadSettingsFile(broken, &settings);
    } catch (const util::StampError& e) {
      line_reported = e.code() == ErrorCode::kInvalidArgument &&
                      std::string(e.what()).find("broken.conf:2") != std::string::npos;
    }
    if (!line_reported) {
      std::cerr << "bad config line not reported with its location\n";
      return EXIT_FAILURE;
    }

    {
      // File < environment < arguments.
      ::setenv("KASSTAMP_CHUNK_SIZE", "7000", 1);
      ::setenv("KASSTAMP_WALLET_ID", "from-env", 1);
      ::setenv("XDG_DATA_HOME", (dir / "xdg").string().c_str(), 1);
      std::vector<std::string> args = {"--config=" + conf.string(), "stamp", "--wallet-id=cli",
                                       "--private", "--", "--chunk-size=1", "notes.txt"};
      const auto settings = config::LoadSettings(&args);
      if (settings.network != "testnet-10" || settings.chunk_size != 7000 ||
          settings.wallet_id != "cli" || settings.priority_fee != 100) {
        std::cerr << "settings precedence mismatch\n";
        return EXIT_FAILURE;
      }
      const std::vector<std::string> expected_rest = {"stamp", "--private", "--chunk-size=1",
                                                      "notes.txt"};
      if (args != expected_rest) {
        std::cerr << "command arguments were not preserved\n";
        return EXIT_FAILURE;
      }
      if (std::filesystem::path(settings.data_dir) != dir / "xdg" / "kasstamp" / "testnet-10") {
        std::cerr << "data directory default mismatch: " << settings.data_dir << "\n";
        return EXIT_FAILURE;
      }
      ClearEnvironment();
    }

    if (!config::ParseNetwork("testnet") ||
        config::ConfigFor(*config::ParseNetwork("testnet")).address_prefix != "kaspatest" ||
        config::ParseNetwork("simnet")) {
      std::cerr << "network lookup mismatch\n";
      return EXIT_FAILURE;
    }

    std::filesystem::remove_all(dir);
  } catch (const std::exception& ex) {
    std::cerr << "settings_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }

  std::cout << "settings_tests: OK\n";
  return 0;
}
