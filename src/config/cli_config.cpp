#include "config/cli_config.hpp"
#include "common/config_manager.hpp"
#include <stdexcept>

static uint256 ParseChainId(const std::string& s, const std::string& source) {
  try {
    return Eth::ParseUint256(s);
  } catch (const std::invalid_argument& e) {
    throw std::invalid_argument("Invalid chain id from " + source + ": " + e.what());
  }
}

static Address ParseSafeAddress(const std::string& s, const std::string& source) {
  try {
    return Eth::ParseAddress(s);
  } catch (const std::invalid_argument& e) {
    throw std::invalid_argument("Invalid Safe address from " + source + ": " + e.what());
  }
}

CliConfig ParseCliArgs(int argc, const char* const* argv) {
  CliConfig cfg;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + a);
      return argv[++i];
    };
    if (a == "-f" || a == "--file") cfg.file = value();
    else if (a == "-j" || a == "--json") cfg.json = value();
    else if (a == "-c" || a == "--chain-id") cfg.chain_id = ParseChainId(value(), a);
    else if (a == "-s" || a == "--safe-address") {
      // empty string means "not provided", as with the default
      std::string v = value();
      if (!v.empty()) cfg.safe_address = ParseSafeAddress(v, a);
    }
    else if (a == "-d" || a == "--decode") cfg.decode = true;
    else if (a == "--env") cfg.env_path = value();
    else if (a == "-h" || a == "--help") cfg.show_help = true;
    else if (a == "-v" || a == "--version") cfg.show_version = true;
    else throw std::invalid_argument("Unknown option: " + a);
  }
  return cfg;
}

void ApplyEnvDefaults(CliConfig& cfg) {
  if (!cfg.chain_id) {
    auto v = ConfigManager::Get("CHAIN_ID");
    cfg.chain_id = v ? ParseChainId(*v, "CHAIN_ID") : uint256(1);
  }
  if (!cfg.safe_address) {
    auto v = ConfigManager::Get("SAFE_ADDRESS");
    if (v && !v->empty()) cfg.safe_address = ParseSafeAddress(*v, "SAFE_ADDRESS");
  }
  if (!cfg.decode) cfg.decode = ConfigManager::GetBoolOr("DECODE_DATA", false);
  if (auto v = ConfigManager::Get("LOG_FILE")) {
    if (!v->empty()) cfg.log_file = *v;
  }
  if (auto v = ConfigManager::Get("LOG_LEVEL")) cfg.log_level = ParseLogLevel(*v);
}

std::string CliUsage() {
  return
    "Usage: safe-tx-hash [options]\n"
    "\n"
    "CLI tool to generate and validate Gnosis Safe transaction hashes\n"
    "\n"
    "Options:\n"
    "  -f, --file <path>             Path to JSON file containing Safe transaction data\n"
    "  -j, --json <string>           JSON string containing Safe transaction data\n"
    "  -c, --chain-id <number>       Chain ID (default: CHAIN_ID from .env, else 1)\n"
    "  -s, --safe-address <address>  Safe contract address (default: SAFE_ADDRESS from .env)\n"
    "  -d, --decode                  Also decode the transaction data field\n"
    "      --env <path>              Settings file (default: .env)\n"
    "  -v, --version                 Print the version number\n"
    "  -h, --help                    Display this help\n";
}
