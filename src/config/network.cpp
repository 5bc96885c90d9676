#include "config/network.hpp"

namespace kasstamp::config {

namespace {

NetworkConfig BuildConfig(NetworkType type, std::string id, std::string prefix,
                          std::string explorer) {
  NetworkConfig cfg;
  cfg.type = type;
  cfg.network_id = std::move(id);
  cfg.address_prefix = std::move(prefix);
  cfg.coin_type = 111111;
  cfg.explorer_tx_url = std::move(explorer);
  return cfg;
}

}  // namespace

const NetworkConfig& ConfigFor(NetworkType type) {
  static const NetworkConfig mainnet = BuildConfig(
      NetworkType::kMainnet, "mainnet", "kaspa", "https://explorer.kaspa.org/txs/");
  static const NetworkConfig testnet10 = BuildConfig(
      NetworkType::kTestnet10, "testnet-10", "kaspatest", "https://explorer-tn10.kaspa.org/txs/");
  switch (type) {
    case NetworkType::kMainnet:
      return mainnet;
    case NetworkType::kTestnet10:
      return testnet10;
  }
  return mainnet;
}

std::optional<NetworkType> ParseNetwork(std::string_view name) {
  if (name == "mainnet" || name == "main") return NetworkType::kMainnet;
  if (name == "testnet-10" || name == "testnet10" || name == "testnet") {
    return NetworkType::kTestnet10;
  }
  return std::nullopt;
}

std::string_view NetworkName(NetworkType type) {
  switch (type) {
    case NetworkType::kMainnet:
      return "mainnet";
    case NetworkType::kTestnet10:
      return "testnet-10";
  }
  return "mainnet";
}

}  // namespace kasstamp::config
