#pragma once
#include "encoding/abi.hpp"
#include <optional>
#include <string>
#include <vector>

struct ValidationResult {
  bool valid = false;
  std::optional<std::string> error;
};

struct DecodedResult {
  bool success = false;
  std::string value;
  std::optional<std::string> error;
};

struct DecodedParam {
  ABI::ParamType type;
  std::string value; // checksummed address or decimal integer
};

struct DecodedFunctionResult : DecodedResult {
  std::optional<std::string> signature; // 0x + 4-byte selector
  std::optional<std::string> name;
  std::optional<std::vector<DecodedParam>> params;
};

// Interprets the data field of a Safe transaction. Holds only a read-only
// selector table, so one instance can be shared between threads.
class TransactionDataDecoder {
public:
  // Uses ERC20::KnownFunctions()
  TransactionDataDecoder();
  explicit TransactionDataDecoder(ABI::FunctionTable functions);

  // Reports only the first failed rule: empty, missing 0x, non-hex, odd length
  ValidationResult ValidateHexData(const std::string& data) const;

  // Drops the leading 32-byte word and reads the rest as UTF-8 text with
  // surrounding whitespace trimmed and NUL padding removed.
  DecodedResult DecodeAsciiData(const std::string& encoded) const;

  // Matches the 4-byte selector against the table and decodes the static
  // parameters that follow it. An unknown selector is a success with only
  // the signature set. A known selector whose parameters fail to decode is
  // still a success, carrying name, signature and an error note.
  DecodedFunctionResult DecodeFunctionCall(const std::string& encoded) const;

  // "Decoding Error: ..." on failure. Values over 100 UTF-8 characters are cut
  // at a character boundary and get "..." appended.
  static std::string FormatDecodedData(const DecodedResult& decoded);

  const ABI::FunctionTable& Functions() const { return functions_; }

private:
  ABI::FunctionTable functions_;
};
