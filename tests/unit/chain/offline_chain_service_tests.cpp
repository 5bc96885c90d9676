#include <array>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "chain/offline_chain_service.hpp"
#include "crypto/address.hpp"
#include "crypto/hd_key.hpp"
#include "payload/payload_codec.hpp"
#include "primitives/amount.hpp"
#include "util/csprng.hpp"
#include "util/error.hpp"

using namespace kasstamp;
using util::ErrorCode;
using util::StampError;

namespace {

constexpr const char* kPrefix = "kaspatest";

template <typename Fn>
bool ThrowsCode(Fn&& fn, ErrorCode code) {
  try {
    fn();
  } catch (const StampError& e) {
    return e.code() == code;
  }
  return false;
}

struct TestKey {
  std::vector<std::uint8_t> secret;
  std::array<std::uint8_t, 32> x_only{};
  std::string address;

  explicit TestKey(std::uint8_t last_byte) : secret(32, 0) {
    secret[31] = last_byte;
    x_only = crypto::XOnlyPublicKey(secret);
    address = crypto::AddressFromXOnlyKey(kPrefix, x_only);
  }

  chain::SigningKey Signing() const { return chain::SigningKey(util::SecureBytes(secret), x_only); }
};

chain::OfflineChainOptions Options(std::optional<std::filesystem::path> journal = std::nullopt) {
  chain::OfflineChainOptions options;
  options.network_id = "testnet-10";
  options.address_prefix = kPrefix;
  options.journal_path = std::move(journal);
  return options;
}

void SignWith(chain::PendingTransaction& tx, const TestKey& key) {
  std::vector<chain::SigningKey> keys;
  keys.push_back(key.Signing());
  tx.Sign(keys);
}

}  // namespace

int main() {
  try {
    const TestKey alice(7);
    const TestKey bob(9);
    const auto dir =
        std::filesystem::temp_directory_path() / ("kasstamp-chain-" + util::RandomUuidV4());
    const auto journal = dir / "chain.jsonl";

    std::string first_id;
    std::string second_id;
    std::vector<std::uint8_t> first_payload{'s', 't', 'a', 'm', 'p'};
    {
      chain::OfflineChainService service(Options(journal));
      service.Load();

      chain::TransactionRequest request;
      request.payload = first_payload;
      const auto estimate = service.Estimate(request);
      if (estimate.transaction_count != 1 || estimate.mass == 0 || estimate.fees < estimate.mass) {
        std::cerr << "estimate without inputs is incomplete\n";
        return EXIT_FAILURE;
      }

      request.change_address = alice.address;
      request.network_id = "testnet-10";
      if (!ThrowsCode([&] { service.Create(request); }, ErrorCode::kNoUtxos)) {
        std::cerr << "create without inputs did not report kNoUtxos\n";
        return EXIT_FAILURE;
      }

      const auto funded = service.Fund(alice.address, 50 * primitives::kSompiPerKas);
      if (service.GetUtxos({alice.address}).size() != 1 || !service.GetUtxos({bob.address}).empty()) {
        std::cerr << "funding did not land on the right address\n";
        return EXIT_FAILURE;
      }

      request.entries = {funded};
      request.outputs = {{bob.address, 100 * primitives::kSompiPerKas}};
      if (!ThrowsCode([&] { service.Create(request); }, ErrorCode::kInsufficientFunds)) {
        std::cerr << "overspend did not report kInsufficientFunds\n";
        return EXIT_FAILURE;
      }
      request.outputs.clear();

      auto wrong_network = request;
      wrong_network.network_id = "mainnet";
      if (!ThrowsCode([&] { service.Create(wrong_network); }, ErrorCode::kInvalidArgument)) {
        std::cerr << "request for another network accepted\n";
        return EXIT_FAILURE;
      }

      auto no_change = request;
      no_change.change_address.clear();
      if (!ThrowsCode([&] { service.Create(no_change); }, ErrorCode::kInvalidArgument)) {
        std::cerr << "change without a change address accepted\n";
        return EXIT_FAILURE;
      }

      auto created = service.Create(request);
      if (created.size() != 1) {
        std::cerr << "expected one pending transaction\n";
        return EXIT_FAILURE;
      }
      auto& tx = *created.front();
      if (tx.Addresses() != std::vector<std::string>{alice.address}) {
        std::cerr << "pending transaction reports the wrong input addresses\n";
        return EXIT_FAILURE;
      }
      if (!ThrowsCode([&] { service.Submit(tx); }, ErrorCode::kTransactionFailed)) {
        std::cerr << "unsigned transaction accepted\n";
        return EXIT_FAILURE;
      }
      if (!ThrowsCode([&] { SignWith(tx, bob); }, ErrorCode::kTransactionFailed)) {
        std::cerr << "signing with an unrelated key succeeded\n";
        return EXIT_FAILURE;
      }
      SignWith(tx, alice);
      const auto change = tx.ChangeOutput();
      if (!change || change->amount != funded.amount - tx.Fee() ||
          change->block_daa_score != primitives::kVirtualDaaScore) {
        std::cerr << "change output does not balance the inputs\n";
        return EXIT_FAILURE;
      }
      first_id = service.Submit(tx);
      if (first_id != tx.Id() || service.GetPayload(first_id) != first_payload) {
        std::cerr << "accepted transaction lost its payload\n";
        return EXIT_FAILURE;
      }
      if (!ThrowsCode([&] { service.Submit(tx); }, ErrorCode::kTransactionFailed)) {
        std::cerr << "transaction accepted twice\n";
        return EXIT_FAILURE;
      }

      // The change is spendable right away by the next transaction in a chain.
      chain::TransactionRequest next;
      next.entries = {*change};
      next.change_address = alice.address;
      next.payload = {'n', 'e', 'x', 't'};
      auto chained = service.Create(next);
      SignWith(*chained.front(), alice);
      second_id = service.Submit(*chained.front());

      // Spending the original funding output again is a double spend.
      auto respend = request;
      respend.payload = {'a', 'g', 'a', 'i', 'n'};
      auto again = service.Create(respend);
      SignWith(*again.front(), alice);
      if (!ThrowsCode([&] { service.Submit(*again.front()); }, ErrorCode::kTransactionFailed)) {
        std::cerr << "double spend accepted\n";
        return EXIT_FAILURE;
      }

      // Oversized payloads fail at submission with a capacity error.
      const auto remaining = service.GetUtxos({alice.address});
      chain::TransactionRequest heavy;
      heavy.entries = remaining;
      heavy.change_address = alice.address;
      heavy.payload.assign(payload::kMaxTransactionMass, 0x55);
      auto too_big = service.Create(heavy);
      SignWith(*too_big.front(), alice);
      if (too_big.front()->Mass() <= payload::kMaxTransactionMass ||
          !ThrowsCode([&] { service.Submit(*too_big.front()); }, ErrorCode::kMassLimit)) {
        std::cerr << "oversized transaction not rejected for mass\n";
        return EXIT_FAILURE;
      }
    }

    {
      // Replaying the journal restores outputs and payloads.
      chain::OfflineChainService replayed(Options(journal));
      replayed.Load();
      if (replayed.transaction_count() != 2 || replayed.GetPayload(first_id) != first_payload ||
          !replayed.GetTransaction(second_id)) {
        std::cerr << "journal replay lost transactions\n";
        return EXIT_FAILURE;
      }
      const auto utxos = replayed.GetUtxos({alice.address});
      if (utxos.size() != 1 || utxos.front().outpoint.transaction_id != second_id) {
        std::cerr << "journal replay produced the wrong unspent set\n";
        return EXIT_FAILURE;
      }
      const auto more = replayed.Fund(bob.address, primitives::kSompiPerKas);
      if (replayed.GetUtxos({bob.address}).size() != 1 ||
          more.outpoint.transaction_id == utxos.front().outpoint.transaction_id) {
        std::cerr << "funding after replay collided with earlier outputs\n";
        return EXIT_FAILURE;
      }
    }
    std::filesystem::remove_all(dir);
  } catch (const std::exception& ex) {
    std::cerr << "offline_chain_service_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }

  std::cout << "offline_chain_service_tests: OK\n";
  return 0;
}
