#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>
#include <io.h>
#else
#include <termios.h>
#include <unistd.h>
#endif

#include "chain/offline_chain_service.hpp"
#include "config/network.hpp"
#include "config/settings.hpp"
#include "nlohmann/json.hpp"
#include "payload/chunk_splitter.hpp"
#include "payload/payload_codec.hpp"
#include "primitives/amount.hpp"
#include "stamping/receipt_validator.hpp"
#include "stamping/reconstructor.hpp"
#include "stamping/stamping_receipt.hpp"
#include "stamping/transaction_batcher.hpp"
#include "util/error.hpp"
#include "util/file_io.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"
#include "wallet/key_value_storage.hpp"
#include "wallet/signing_enclave.hpp"

namespace {

using kasstamp::util::ErrorCode;
using kasstamp::util::Fail;

constexpr std::size_t kMaxInputBytes = 512u * 1024u * 1024u;
constexpr std::size_t kMaxReceiptBytes = 1024u * 1024u;

struct Context {
  kasstamp::config::Settings settings;
  kasstamp::config::NetworkConfig network;
  std::vector<std::string> args;
};

bool HasFlag(const std::vector<std::string>& args, std::string_view flag) {
  for (const auto& arg : args) {
    if (arg == flag) {
      return true;
    }
  }
  return false;
}

std::optional<std::string> FindPrefixedOptionValue(const std::vector<std::string>& args,
                                                   std::string_view prefix) {
  for (std::size_t i = 1; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg.rfind(prefix, 0) == 0) {
      return arg.substr(prefix.size());
    }
  }
  return std::nullopt;
}

// Operands after the command, skipping "--flag" style options.
std::vector<std::string> Positionals(const std::vector<std::string>& args) {
  std::vector<std::string> out;
  for (std::size_t i = 1; i < args.size(); ++i) {
    if (args[i].rfind("--", 0) != 0) {
      out.push_back(args[i]);
    }
  }
  return out;
}

const std::string& RequirePositional(const std::vector<std::string>& positionals,
                                     std::size_t index, std::string_view what) {
  if (index >= positionals.size()) {
    Fail(ErrorCode::kInvalidArgument, "missing " + std::string(what));
  }
  return positionals[index];
}

bool IsStdinInteractive() {
#ifdef _WIN32
  return _isatty(_fileno(stdin)) != 0;
#else
  return isatty(fileno(stdin)) != 0;
#endif
}

std::string TrimTrailingNewlines(std::string input) {
  while (!input.empty() && (input.back() == '\n' || input.back() == '\r')) {
    input.pop_back();
  }
  return input;
}

std::string ReadFirstLineFromFile(const std::string& path, std::string_view label) {
  std::ifstream in(path, std::ios::in);
  if (!in) {
    Fail(ErrorCode::kInvalidArgument, "unable to read " + std::string(label) + " file: " + path);
  }
  std::string line;
  std::getline(in, line);
  return TrimTrailingNewlines(std::move(line));
}

std::string ReadLineFromStdin(std::string_view label) {
  std::string line;
  if (!std::getline(std::cin, line)) {
    Fail(ErrorCode::kInvalidArgument, "failed to read " + std::string(label) + " from stdin");
  }
  return TrimTrailingNewlines(std::move(line));
}

std::string PromptHidden(std::string_view prompt) {
  if (!IsStdinInteractive()) {
    Fail(ErrorCode::kInvalidArgument, "stdin is not interactive; use -stdin or -file options");
  }
  std::cerr << prompt;
  std::string line;
#ifdef _WIN32
  const HANDLE handle = GetStdHandle(STD_INPUT_HANDLE);
  DWORD original_mode = 0;
  bool have_mode = false;
  if (handle != INVALID_HANDLE_VALUE && GetConsoleMode(handle, &original_mode)) {
    have_mode = true;
    const DWORD new_mode = original_mode & ~static_cast<DWORD>(ENABLE_ECHO_INPUT);
    (void)SetConsoleMode(handle, new_mode);
  }
  std::getline(std::cin, line);
  if (have_mode) {
    (void)SetConsoleMode(handle, original_mode);
  }
  std::cerr << "\n";
#else
  termios original{};
  bool have_termios = false;
  if (tcgetattr(STDIN_FILENO, &original) == 0) {
    have_termios = true;
    termios updated = original;
    updated.c_lflag &= static_cast<tcflag_t>(~ECHO);
    (void)tcsetattr(STDIN_FILENO, TCSAFLUSH, &updated);
  }
  std::getline(std::cin, line);
  if (have_termios) {
    (void)tcsetattr(STDIN_FILENO, TCSAFLUSH, &original);
    std::cerr << "\n";
  }
#endif
  return TrimTrailingNewlines(std::move(line));
}

// Secrets come from exactly one of "<stdin_flag>", "<file_prefix><path>" or
// an interactive prompt; there is no inline --password=value form.
std::string ReadSecretFromArgs(const std::vector<std::string>& args, std::string_view stdin_flag,
                               std::string_view file_prefix, std::string_view label) {
  std::optional<std::string> value;
  int sources = 0;
  if (HasFlag(args, stdin_flag)) {
    ++sources;
    value = ReadLineFromStdin(label);
  }
  if (auto file = FindPrefixedOptionValue(args, file_prefix)) {
    ++sources;
    value = ReadFirstLineFromFile(*file, label);
  }
  if (sources > 1) {
    Fail(ErrorCode::kInvalidArgument, "specify only one of " + std::string(stdin_flag) + " or " +
                                          std::string(file_prefix) + "<path>");
  }
  if (!value) {
    value = PromptHidden("Enter " + std::string(label) + ": ");
  }
  if (value->empty()) {
    Fail(ErrorCode::kInvalidArgument, std::string(label) + " must not be empty");
  }
  return *value;
}

std::string ReadPassword(const std::vector<std::string>& args) {
  return ReadSecretFromArgs(args, "--password-stdin", "--password-file=", "wallet password");
}

std::vector<std::uint8_t> ReadInputFile(const std::string& path) {
  std::vector<std::uint8_t> bytes;
  std::string error;
  if (!kasstamp::util::ReadFileBytes(path, kMaxInputBytes, &bytes, &error)) {
    Fail(ErrorCode::kStorageFailure, error);
  }
  return bytes;
}

void WriteOutputFile(const std::filesystem::path& path, std::span<const std::uint8_t> bytes) {
  std::string error;
  if (!kasstamp::util::AtomicWriteFile(path, bytes, false, &error)) {
    Fail(ErrorCode::kStorageFailure, error);
  }
}

std::filesystem::path WalletDir(const Context& ctx) {
  return std::filesystem::path(ctx.settings.data_dir) / "wallet";
}

std::unique_ptr<kasstamp::chain::OfflineChainService> OpenChain(const Context& ctx) {
  kasstamp::chain::OfflineChainOptions options;
  options.network_id = ctx.network.network_id;
  options.address_prefix = ctx.network.address_prefix;
  options.journal_path = std::filesystem::path(ctx.settings.data_dir) / "chain.jsonl";
  auto chain = std::make_unique<kasstamp::chain::OfflineChainService>(std::move(options));
  chain->Load();
  return chain;
}

kasstamp::wallet::EnclaveOptions EnclaveOptionsFor(const Context& ctx) {
  kasstamp::wallet::EnclaveOptions options;
  options.wallet_id = ctx.settings.wallet_id;
  options.kdf_params = ctx.settings.argon2;
  options.coin_type = ctx.network.coin_type;
  return options;
}

void UnlockEnclave(const Context& ctx, kasstamp::wallet::SigningEnclave& enclave) {
  if (!enclave.HasMnemonic()) {
    Fail(ErrorCode::kNoMnemonic, "no wallet stored under '" + ctx.settings.wallet_id +
                                     "'; run wallet-store first");
  }
  const auto minutes = std::chrono::minutes(ctx.settings.auto_lock_minutes);
  enclave.Unlock(ReadPassword(ctx.args),
                 std::chrono::duration_cast<std::chrono::milliseconds>(minutes));
}

std::vector<kasstamp::stamping::ArtifactInput> CollectArtifacts(const Context& ctx) {
  std::vector<kasstamp::stamping::ArtifactInput> artifacts;
  if (auto text = FindPrefixedOptionValue(ctx.args, "--text=")) {
    artifacts.push_back(kasstamp::stamping::TextArtifact(
        *text, FindPrefixedOptionValue(ctx.args, "--name=").value_or(std::string{})));
  }
  for (const auto& path : Positionals(ctx.args)) {
    kasstamp::stamping::ArtifactInput input;
    input.name = std::filesystem::path(path).filename().string();
    input.bytes = ReadInputFile(path);
    artifacts.push_back(std::move(input));
  }
  if (artifacts.empty()) {
    Fail(ErrorCode::kInvalidArgument, "nothing to stamp; pass files or --text=<text>");
  }
  return artifacts;
}

kasstamp::stamping::BatcherOptions BatcherOptionsFor(const Context& ctx) {
  kasstamp::stamping::BatcherOptions options;
  options.mode = HasFlag(ctx.args, "--private") ? kasstamp::payload::StampingMode::kPrivate
                                                : kasstamp::payload::StampingMode::kPublic;
  options.preparation.compress = ctx.settings.compress;
  options.preparation.chunk_size = ctx.settings.chunk_size;
  options.priority_fee = ctx.settings.priority_fee;
  options.network = ctx.network;
  if (auto account = FindPrefixedOptionValue(ctx.args, "--account=")) {
    options.account_index = static_cast<std::uint32_t>(std::stoul(*account));
  }
  return options;
}

kasstamp::stamping::StampingReceipt LoadReceipt(const std::string& path) {
  std::string text;
  std::string error;
  if (!kasstamp::util::ReadFileText(path, kMaxReceiptBytes, &text, &error)) {
    Fail(ErrorCode::kStorageFailure, error);
  }
  return kasstamp::stamping::ParseReceipt(text);
}

int CmdSplit(const Context& ctx) {
  const auto positionals = Positionals(ctx.args);
  const auto data = ReadInputFile(RequirePositional(positionals, 0, "input file"));
  kasstamp::payload::SplitOptions options;
  options.chunk_size = ctx.settings.chunk_size;
  if (auto min_chunks = FindPrefixedOptionValue(ctx.args, "--min-chunks=")) {
    options.min_chunks = static_cast<std::size_t>(std::stoul(*min_chunks));
  }
  const auto chunks = kasstamp::payload::SplitIntoChunks(data, options);
  nlohmann::json out = nlohmann::json::array();
  for (const auto& chunk : chunks) {
    out.push_back({{"groupId", chunk.group_id},
                   {"index", chunk.index},
                   {"total", chunk.total},
                   {"size", chunk.data.size()},
                   {"digest", chunk.digest}});
  }
  std::cout << out.dump(2) << "\n";
  return 0;
}

int CmdEncode(const Context& ctx) {
  const auto positionals = Positionals(ctx.args);
  kasstamp::payload::StampingEnvelope envelope;
  envelope.chunk_data = ReadInputFile(RequirePositional(positionals, 0, "input file"));
  if (auto metadata = FindPrefixedOptionValue(ctx.args, "--metadata=")) {
    try {
      envelope.metadata = nlohmann::json::parse(*metadata);
    } catch (const nlohmann::json::parse_error& e) {
      Fail(ErrorCode::kMetadataJson, std::string("--metadata is not JSON: ") + e.what());
    }
  }
  const auto encoded = kasstamp::payload::EncodePayload(envelope);
  if (HasFlag(ctx.args, "--verbose")) {
    std::cerr << "metadata: " << encoded.debug.metadata_json << "\n"
              << "total bytes: " << encoded.structure.total_bytes << "\n"
              << "estimated mass: " << encoded.mass.total
              << (encoded.mass.within_limit ? "" : " (over the limit)") << "\n";
  }
  std::cout << kasstamp::util::HexEncode(encoded.payload) << "\n";
  return 0;
}

int CmdDecode(const Context& ctx) {
  const auto positionals = Positionals(ctx.args);
  std::string hex = RequirePositional(positionals, 0, "payload hex or '-'");
  if (hex == "-") {
    hex.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  const auto decoded = kasstamp::payload::DecodePayloadHex(hex);
  if (auto out_path = FindPrefixedOptionValue(ctx.args, "--out=")) {
    WriteOutputFile(*out_path, decoded.chunk_data);
  }
  nlohmann::json out{{"metadata", decoded.metadata},
                     {"metadataLength", decoded.metadata_length},
                     {"validSeparator", decoded.valid_separator},
                     {"chunkBytes", decoded.chunk_data.size()},
                     {"totalBytes", decoded.total_bytes},
                     {"preview", kasstamp::util::HexPreview(decoded.preview, 32)}};
  std::cout << out.dump(2) << "\n";
  return 0;
}

int CmdWalletStore(const Context& ctx) {
  kasstamp::wallet::DirectoryStorage storage(WalletDir(ctx));
  kasstamp::wallet::SigningEnclave enclave(storage, EnclaveOptionsFor(ctx));
  if (enclave.HasMnemonic() && !HasFlag(ctx.args, "--force")) {
    Fail(ErrorCode::kInvalidArgument, "wallet '" + ctx.settings.wallet_id +
                                          "' already exists; pass --force to replace it");
  }
  const auto mnemonic =
      ReadSecretFromArgs(ctx.args, "--mnemonic-stdin", "--mnemonic-file=", "mnemonic");
  const auto password = ReadPassword(ctx.args);
  std::string passphrase;
  if (auto file = FindPrefixedOptionValue(ctx.args, "--passphrase-file=")) {
    passphrase = ReadFirstLineFromFile(*file, "passphrase");
  }
  enclave.StoreMnemonic(mnemonic, password, passphrase);
  std::cout << "stored wallet '" << ctx.settings.wallet_id << "' in " << WalletDir(ctx).string()
            << "\n";
  return 0;
}

int CmdWalletStatus(const Context& ctx) {
  kasstamp::wallet::DirectoryStorage storage(WalletDir(ctx));
  kasstamp::wallet::SigningEnclave enclave(storage, EnclaveOptionsFor(ctx));
  const auto status = enclave.GetStatus();
  nlohmann::json out{{"walletId", ctx.settings.wallet_id},
                     {"hasMnemonic", status.has_mnemonic},
                     {"isLocked", status.is_locked},
                     {"network", ctx.network.network_id}};
  std::cout << out.dump(2) << "\n";
  return 0;
}

int CmdWalletAddress(const Context& ctx) {
  kasstamp::wallet::DirectoryStorage storage(WalletDir(ctx));
  kasstamp::wallet::SigningEnclave enclave(storage, EnclaveOptionsFor(ctx));
  UnlockEnclave(ctx, enclave);
  kasstamp::crypto::KeyDerivation derivation;
  if (auto account = FindPrefixedOptionValue(ctx.args, "--account=")) {
    derivation.account_index = static_cast<std::uint32_t>(std::stoul(*account));
  }
  if (auto index = FindPrefixedOptionValue(ctx.args, "--index=")) {
    derivation.address_index = static_cast<std::uint32_t>(std::stoul(*index));
  }
  derivation.is_receive = !HasFlag(ctx.args, "--change");
  std::cout << enclave.DeriveAddress(ctx.network, derivation) << "\n";
  enclave.Lock();
  return 0;
}

int CmdFund(const Context& ctx) {
  const auto positionals = Positionals(ctx.args);
  const auto& address = RequirePositional(positionals, 0, "address");
  const auto& amount_text = RequirePositional(positionals, 1, "amount in sompi");
  if (amount_text.find_first_not_of("0123456789") != std::string::npos) {
    Fail(ErrorCode::kInvalidArgument, "amount must be an integer number of sompi");
  }
  auto chain = OpenChain(ctx);
  const auto entry = chain->Fund(address, std::stoull(amount_text));
  std::cout << "funded " << address << " with " << kasstamp::primitives::FormatKas(entry.amount)
            << " KAS (" << entry.outpoint.transaction_id << ":" << entry.outpoint.index << ")\n";
  return 0;
}

int CmdEstimate(const Context& ctx) {
  auto chain = OpenChain(ctx);
  kasstamp::wallet::DirectoryStorage storage(WalletDir(ctx));
  kasstamp::wallet::SigningEnclave enclave(storage, EnclaveOptionsFor(ctx));
  auto options = BatcherOptionsFor(ctx);
  if (options.mode == kasstamp::payload::StampingMode::kPrivate) {
    UnlockEnclave(ctx, enclave);
  }
  kasstamp::stamping::TransactionBatcher batcher(*chain, *chain, enclave, std::move(options));
  const auto estimation = batcher.Estimate(CollectArtifacts(ctx));
  nlohmann::json artifacts = nlohmann::json::array();
  for (const auto& a : estimation.artifacts) {
    nlohmann::json entry{{"name", a.name},
                         {"chunks", a.chunk_count},
                         {"transactions", a.transaction_count},
                         {"feesKAS", kasstamp::primitives::FormatKas(a.total_fees)},
                         {"mass", a.total_mass},
                         {"payloadBytes", a.payload_bytes},
                         {"withinMassLimit", a.within_mass_limit}};
    if (a.error) {
      entry["error"] = *a.error;
    }
    artifacts.push_back(std::move(entry));
  }
  nlohmann::json out{{"artifacts", std::move(artifacts)},
                     {"chunks", estimation.chunk_count},
                     {"transactions", estimation.transaction_count},
                     {"feesKAS", kasstamp::primitives::FormatKas(estimation.total_fees)},
                     {"mass", estimation.total_mass},
                     {"payloadBytes", estimation.payload_bytes},
                     {"fundingUtxos", estimation.utxo_count}};
  std::cout << out.dump(2) << "\n";
  enclave.Lock();
  return 0;
}

int CmdStamp(const Context& ctx) {
  auto chain = OpenChain(ctx);
  kasstamp::wallet::DirectoryStorage storage(WalletDir(ctx));
  kasstamp::wallet::SigningEnclave enclave(storage, EnclaveOptionsFor(ctx));
  const auto artifacts = CollectArtifacts(ctx);
  UnlockEnclave(ctx, enclave);
  kasstamp::stamping::TransactionBatcher batcher(*chain, *chain, enclave, BatcherOptionsFor(ctx));
  const auto result = batcher.Commit(artifacts, nullptr, [](std::size_t done, std::size_t total) {
    std::cerr << "\rsubmitted " << done << "/" << total << std::flush;
  });
  std::cerr << "\n";
  enclave.Lock();

  const std::filesystem::path out_dir =
      FindPrefixedOptionValue(ctx.args, "--out-dir=").value_or(std::string{"."});
  for (std::size_t i = 0; i < result.artifacts.size(); ++i) {
    const auto& artifact = result.artifacts[i];
    std::cout << artifact.name << ": "
              << kasstamp::stamping::ArtifactStampStatusName(artifact.status) << " ("
              << artifact.transaction_ids.size() << " tx, "
              << kasstamp::primitives::FormatKas(artifact.fees) << " KAS)";
    if (artifact.error) {
      std::cout << " - " << *artifact.error;
    }
    std::cout << "\n";
    if (!artifact.receipt) {
      continue;
    }
    const auto path = out_dir / (artifact.receipt->id + ".receipt.json");
    const auto text = kasstamp::stamping::ReceiptToJson(*artifact.receipt).dump(2);
    std::string error;
    if (!kasstamp::util::AtomicWriteText(path, text, false, &error)) {
      Fail(ErrorCode::kStorageFailure, error);
    }
    std::cout << "  receipt: " << path.string() << "\n";
    if (!ctx.network.explorer_tx_url.empty()) {
      std::cout << "  explorer: " << ctx.network.explorer_tx_url << artifact.receipt->id << "\n";
    }
  }
  std::cout << "total fees: " << kasstamp::primitives::FormatKas(result.total_fees) << " KAS\n";
  return result.all_complete() ? 0 : 2;
}

int CmdValidateReceipt(const Context& ctx) {
  const auto positionals = Positionals(ctx.args);
  std::string text;
  std::string error;
  if (!kasstamp::util::ReadFileText(RequirePositional(positionals, 0, "receipt file"),
                                    kMaxReceiptBytes, &text, &error)) {
    Fail(ErrorCode::kStorageFailure, error);
  }
  nlohmann::json receipt;
  try {
    receipt = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    std::cout << "invalid: receipt is not JSON (" << e.what() << ")\n";
    return 1;
  }
  const auto result = kasstamp::stamping::ValidateReceipt(receipt);
  for (const auto& message : result.errors) {
    std::cout << "error: " << message << "\n";
  }
  for (const auto& message : result.warnings) {
    std::cout << "warning: " << message << "\n";
  }
  std::cout << (result.valid ? "valid" : "invalid") << "\n";
  return result.valid ? 0 : 1;
}

int CmdReconstruct(const Context& ctx) {
  const auto positionals = Positionals(ctx.args);
  const auto receipt = LoadReceipt(RequirePositional(positionals, 0, "receipt file"));
  auto chain = OpenChain(ctx);
  const kasstamp::stamping::PayloadLookup lookup = [&chain](const std::string& id) {
    auto payload = chain->GetPayload(id);
    if (!payload) {
      Fail(ErrorCode::kTransactionFailed, "transaction " + id + " is not known to the chain");
    }
    return *payload;
  };

  std::optional<kasstamp::wallet::DirectoryStorage> storage;
  std::optional<kasstamp::wallet::SigningEnclave> enclave;
  if (receipt.mode == kasstamp::payload::StampingMode::kPrivate) {
    storage.emplace(WalletDir(ctx));
    enclave.emplace(*storage, EnclaveOptionsFor(ctx));
    UnlockEnclave(ctx, *enclave);
  }
  const auto result =
      kasstamp::stamping::Reconstruct(receipt, lookup, enclave ? &*enclave : nullptr);
  if (enclave) {
    enclave->Lock();
  }
  const std::filesystem::path out_path =
      FindPrefixedOptionValue(ctx.args, "--out=")
          .value_or(std::filesystem::path(result.file_name).filename().string());
  WriteOutputFile(out_path, result.data);
  std::cout << "wrote " << result.data.size() << " bytes to " << out_path.string() << " from "
            << result.chunks << " chunk(s)\n"
            << "hash " << (result.hash_matches ? "matches" : "MISMATCH") << ": "
            << result.reconstructed_hash << "\n";
  return result.hash_matches ? 0 : 3;
}

void PrintUsage() {
  std::cout << "Usage: kasstamp-cli [options] <command> [params]\n"
            << "Commands:\n"
            << "  split <file> [--min-chunks=N]\n"
            << "  encode <file> [--metadata=<json>] [--verbose]\n"
            << "  decode <hex|-> [--out=<file>]\n"
            << "  wallet-store [--mnemonic-stdin|--mnemonic-file=<path>] [--passphrase-file=<path>]"
               " [--force]\n"
            << "  wallet-status\n"
            << "  wallet-address [--account=N] [--index=N] [--change]\n"
            << "  fund <address> <sompi>           Credit an address on the offline chain\n"
            << "  estimate [files...] [--text=<text>] [--name=<name>] [--private]\n"
            << "  stamp [files...] [--text=<text>] [--name=<name>] [--private] [--account=N]"
               " [--out-dir=<dir>]\n"
            << "  validate-receipt <receipt.json>\n"
            << "  reconstruct <receipt.json> [--out=<file>]\n"
            << "Wallet commands read the password from --password-stdin, --password-file=<path>\n"
            << "or an interactive prompt.\n"
            << "Options:\n"
            << "  --config=<path>            Settings file (default: ./kasstamp.conf)\n"
            << "  --network=<mainnet|testnet-10>\n"
            << "  --data-dir=<dir>           Wallet and offline chain directory\n"
            << "  --chunk-size=<bytes>       Default: 20000\n"
            << "  --compress=<0|1>\n"
            << "  --priority-fee=<sompi>\n"
            << "  --auto-lock-minutes=<N>    0 disables auto-lock\n"
            << "  --log-level=<debug|info|warn|error>\n"
            << "  --debug-log=<path>\n";
}

void ConfigureLogging(const kasstamp::config::Settings& settings) {
  auto& logger = kasstamp::util::GlobalLogger();
  logger.Configure(kasstamp::util::ParseLogLevelString(settings.log_level),
                   static_cast<std::uintmax_t>(settings.log_max_size_mb) * 1024u * 1024u,
                   settings.log_max_files);
  if (!settings.debug_log_path.empty()) {
    logger.Enable(settings.debug_log_path);
  }
}

}  // namespace

int main(int argc, char** argv) {
  try {
    Context ctx;
    for (int i = 1; i < argc; ++i) {
      ctx.args.emplace_back(argv[i]);
    }
    ctx.settings = kasstamp::config::LoadSettings(&ctx.args);
    ConfigureLogging(ctx.settings);
    const auto network = kasstamp::config::ParseNetwork(ctx.settings.network);
    if (!network) {
      Fail(ErrorCode::kInvalidArgument, "unknown network '" + ctx.settings.network + "'");
    }
    ctx.network = kasstamp::config::ConfigFor(*network);

    if (ctx.args.empty() || HasFlag(ctx.args, "--help") || HasFlag(ctx.args, "-h")) {
      PrintUsage();
      return ctx.args.empty() ? 1 : 0;
    }
    const std::string& command = ctx.args.front();
    if (command == "split") return CmdSplit(ctx);
    if (command == "encode") return CmdEncode(ctx);
    if (command == "decode") return CmdDecode(ctx);
    if (command == "wallet-store") return CmdWalletStore(ctx);
    if (command == "wallet-status") return CmdWalletStatus(ctx);
    if (command == "wallet-address") return CmdWalletAddress(ctx);
    if (command == "fund") return CmdFund(ctx);
    if (command == "estimate") return CmdEstimate(ctx);
    if (command == "stamp") return CmdStamp(ctx);
    if (command == "validate-receipt") return CmdValidateReceipt(ctx);
    if (command == "reconstruct") return CmdReconstruct(ctx);
    std::cerr << "kasstamp-cli: unknown command '" << command << "'\n";
    PrintUsage();
    return 1;
  } catch (const kasstamp::util::StampError& ex) {
    std::cerr << "kasstamp-cli: " << ex.what() << " ["
              << kasstamp::util::ErrorCategoryName(ex.category()) << "]\n";
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "kasstamp-cli: " << ex.what() << "\n";
    return 1;
  }
}
