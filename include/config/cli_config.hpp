#pragma once
#include "common/logger.hpp"
#include "common/types.hpp"
#include <optional>
#include <string>

struct CliConfig {
  std::optional<std::string> file;
  std::optional<std::string> json;
  std::optional<uint256> chain_id;
  std::optional<Address> safe_address;
  bool decode = false;
  bool show_help = false;
  bool show_version = false;
  std::string env_path = ".env";
  std::string log_file = "safe-tx-hash.log";
  LogLevel log_level = LogLevel::INFO;
};

// Parses command line flags (argv[0] is skipped). Throws std::invalid_argument
// on unknown flags, missing values, or a malformed chain id / Safe address.
CliConfig ParseCliArgs(int argc, const char* const* argv);

// Fills settings not given on the command line from ConfigManager keys
// CHAIN_ID, SAFE_ADDRESS, DECODE_DATA, LOG_FILE and LOG_LEVEL. Chain id falls
// back to 1. Throws std::invalid_argument on malformed values.
void ApplyEnvDefaults(CliConfig& cfg);

std::string CliUsage();
