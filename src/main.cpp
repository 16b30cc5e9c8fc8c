#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "config/cli_config.hpp"
#include "safe/data_decoder.hpp"
#include "safe/tx_hasher.hpp"
#include "safe/tx_loader.hpp"
#include "utils/hex.hpp"
#include <iostream>
#include <stdexcept>

static const char* kVersion = "1.0.0";

static void PrintParams(const DecodedFunctionResult& r) {
  if (!r.params) return;
  for (size_t i = 0; i < r.params->size(); ++i) {
    const auto& p = (*r.params)[i];
    std::cout << "  [" << i << "] " << ABI::TypeName(p.type) << ": " << p.value << std::endl;
  }
}

static void PrintDecodedData(const TransactionDataDecoder& decoder, const std::string& data_hex) {
  std::cout << "\nDecoded Data:" << std::endl;
  if (data_hex == "0x") {
    std::cout << "Function:       (none, empty data)" << std::endl;
    return;
  }
  auto call = decoder.DecodeFunctionCall(data_hex);
  std::cout << "Function:       " << TransactionDataDecoder::FormatDecodedData(call) << std::endl;
  if (call.error && call.success) std::cout << "Note:           " << *call.error << std::endl;
  PrintParams(call);

  // Some Safe apps wrap the real call as ABI-encoded ASCII text
  if (call.name) return;
  auto ascii = decoder.DecodeAsciiData(data_hex);
  if (!ascii.success || ascii.value.rfind("0x", 0) != 0) return;
  std::cout << "ASCII Payload:  " << TransactionDataDecoder::FormatDecodedData(ascii) << std::endl;
  auto inner = decoder.DecodeFunctionCall(ascii.value);
  std::cout << "Inner Function: " << TransactionDataDecoder::FormatDecodedData(inner) << std::endl;
  PrintParams(inner);
}

int main(int argc, char** argv) {
  CliConfig cfg;
  try {
    cfg = ParseCliArgs(argc, argv);
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n\n" << CliUsage();
    return 1;
  }
  if (cfg.show_help) { std::cout << CliUsage(); return 0; }
  if (cfg.show_version) { std::cout << kVersion << std::endl; return 0; }

  std::cerr << "\nWARNING: This tool only supports Gnosis Safe version 1.3.0\n" << std::endl;

  const bool env_loaded = ConfigManager::Initialize(cfg.env_path);
  try {
    ApplyEnvDefaults(cfg);
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  if (!Logger::Initialize(cfg.log_file, cfg.log_level)) {
    std::cerr << "Warning: cannot open log file " << cfg.log_file << std::endl;
  }
  Logger::Info("safe-tx-hash " + std::string(kVersion) + " starting");
  if (!env_loaded) Logger::Info("No settings file at " + cfg.env_path + ", using flags and defaults");

  if (!cfg.file && !cfg.json) {
    std::cerr << "Error: Either --file or --json option is required\n\n" << CliUsage();
    Logger::Error("Neither --file nor --json given", __FILE__, __LINE__);
    Logger::Shutdown();
    return 1;
  }

  int rc = 0;
  try {
    SafeTransaction tx = cfg.file ? SafeTx::LoadTransactionFile(*cfg.file) : SafeTx::ParseTransactionJson(*cfg.json);

    if (!cfg.safe_address) {
      std::cerr << "Warning: No Safe address provided. Using default domain data." << std::endl;
      Logger::Warning("No Safe address provided, hashing against the zero address", __FILE__, __LINE__);
    }
    SafeDomain domain;
    domain.chain_id = *cfg.chain_id;
    domain.verifying_contract = cfg.safe_address.value_or(Eth::kZeroAddress);

    SafeTxHasher hasher(domain);
    SafeTxHashes hashes = hasher.AllHashes(tx);
    Logger::Info("Computed Safe tx hash " + Eth::ToHex(hashes.final_hash) + " for chain " + Eth::ToDecimal(domain.chain_id));

    const std::string data_hex = BytesToHex0x(tx.data);
    std::cout << "\n=== Safe Transaction Hashes ===\n" << std::endl;
    std::cout << "Chain ID:       " << Eth::ToDecimal(domain.chain_id) << std::endl;
    std::cout << "Safe Address:   " << Eth::ToChecksumAddress(domain.verifying_contract) << std::endl;
    std::cout << "\nTransaction Details:" << std::endl;
    std::cout << "To:             " << Eth::ToChecksumAddress(tx.to) << std::endl;
    std::cout << "Value:          " << Eth::ToDecimal(tx.value) << std::endl;
    std::cout << "Data:           " << (data_hex.size() > 66 ? data_hex.substr(0, 66) + "..." : data_hex) << std::endl;
    std::cout << "Operation:      " << static_cast<int>(tx.operation) << std::endl;
    std::cout << "Nonce:          " << Eth::ToDecimal(tx.nonce) << std::endl;

    if (cfg.decode) {
      TransactionDataDecoder decoder;
      PrintDecodedData(decoder, data_hex);
    }

    std::cout << "\nGenerated Hashes (verify these on your hardware wallet):" << std::endl;
    std::cout << "Domain Hash:    " << Eth::ToHex(hashes.domain_hash) << std::endl;
    std::cout << "Message Hash:   " << Eth::ToHex(hashes.message_hash) << std::endl;
    std::cout << "Safe Tx Hash:   " << Eth::ToHex(hashes.final_hash) << std::endl;
    std::cout << std::endl;
  } catch (const SafeTx::LoadError& e) {
    std::cerr << "Error loading transaction: " << e.what() << std::endl;
    Logger::Error(e.what(), __FILE__, __LINE__);
    rc = 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    Logger::Critical(e.what(), __FILE__, __LINE__);
    rc = 1;
  }
  Logger::Shutdown();
  return rc;
}
