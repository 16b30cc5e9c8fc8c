#pragma once
#include "safe/safe_tx.hpp"
#include <stdexcept>
#include <string>

namespace SafeTx {
  class LoadError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // Parses a JSON object with the SafeTx fields. to, data, operation and nonce
  // are required; value and the gas fields default to 0, gasToken and
  // refundReceiver to the zero address. Integers may be JSON numbers, decimal
  // strings or 0x hex strings. Throws LoadError.
  SafeTransaction ParseTransactionJson(const std::string& json_text);

  // Reads the file and parses it with ParseTransactionJson. Throws LoadError.
  SafeTransaction LoadTransactionFile(const std::string& path);
}
