#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kasstamp::config {

enum class NetworkType {
  kMainnet,
  kTestnet10,
};

struct NetworkConfig {
  NetworkType type{NetworkType::kMainnet};
  // Identifier handed to the transaction service and written into receipts.
  std::string network_id{"mainnet"};
  std::string address_prefix{"kaspa"};
  std::uint32_t coin_type{111111};
  std::string explorer_tx_url;
};

const NetworkConfig& ConfigFor(NetworkType type);
std::optional<NetworkType> ParseNetwork(std::string_view name);
std::string_view NetworkName(NetworkType type);

}  // namespace kasstamp::config
