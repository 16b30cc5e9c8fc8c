#include "safe/tx_loader.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
  const char* const kRequiredFields[] = {"to", "data", "operation", "nonce"};

  bool IsAbsent(const json& j, const char* field) {
    if (!j.contains(field)) return true;
    const json& v = j[field];
    return v.is_null() || (v.is_string() && v.get<std::string>().empty());
  }

  uint256 ReadUint(const json& j, const char* field) {
    if (IsAbsent(j, field)) return 0;
    const json& v = j[field];
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_number_integer()) throw SafeTx::LoadError(std::string("Invalid field '") + field + "': negative value");
    if (v.is_string()) {
      try {
        return Eth::ParseUint256(v.get<std::string>());
      } catch (const std::invalid_argument& e) {
        throw SafeTx::LoadError(std::string("Invalid field '") + field + "': " + e.what());
      }
    }
    throw SafeTx::LoadError(std::string("Invalid field '") + field + "': expected an unsigned integer, got " + v.dump());
  }

  Address ReadAddress(const json& j, const char* field, bool required = false) {
    if (!required && IsAbsent(j, field)) return Eth::kZeroAddress;
    const json& v = j[field];
    if (!v.is_string()) throw SafeTx::LoadError(std::string("Invalid field '") + field + "': expected an address string");
    try {
      return Eth::ParseAddress(v.get<std::string>());
    } catch (const std::invalid_argument& e) {
      throw SafeTx::LoadError(std::string("Invalid field '") + field + "': " + e.what());
    }
  }

  Bytes ReadData(const json& j) {
    const json& v = j["data"];
    if (!v.is_string()) throw SafeTx::LoadError("Invalid field 'data': expected a 0x hex string");
    const std::string s = v.get<std::string>();
    if (s.rfind("0x", 0) != 0 || !IsHexDigits(s, 2) || s.size() % 2 != 0) {
      throw SafeTx::LoadError("Invalid field 'data': not a 0x-prefixed even-length hex string");
    }
    return HexToBytes(s);
  }

  SafeOperation ReadOperation(const json& j) {
    uint256 op = ReadUint(j, "operation");
    if (op == 0) return SafeOperation::CALL;
    if (op == 1) return SafeOperation::DELEGATE_CALL;
    throw SafeTx::LoadError("Invalid field 'operation': must be 0 (Call) or 1 (DelegateCall)");
  }
}

namespace SafeTx {
  SafeTransaction ParseTransactionJson(const std::string& json_text) {
    auto j = json::parse(json_text, nullptr, false);
    if (j.is_discarded()) throw LoadError("Invalid JSON");
    if (!j.is_object()) throw LoadError("Transaction JSON must be an object");
    for (const char* field : kRequiredFields) {
      if (!j.contains(field) || j[field].is_null()) throw LoadError(std::string("Missing required field: ") + field);
    }

    SafeTransaction tx;
    tx.to = ReadAddress(j, "to", true);
    tx.value = ReadUint(j, "value");
    tx.data = ReadData(j);
    tx.operation = ReadOperation(j);
    tx.safe_tx_gas = ReadUint(j, "safeTxGas");
    tx.base_gas = ReadUint(j, "baseGas");
    tx.gas_price = ReadUint(j, "gasPrice");
    tx.gas_token = ReadAddress(j, "gasToken");
    tx.refund_receiver = ReadAddress(j, "refundReceiver");
    tx.nonce = ReadUint(j, "nonce");
    if (Logger::IsEnabled(LogLevel::DEBUG)) {
      Logger::Debug("Parsed Safe transaction to " + Eth::ToHex(tx.to) + " nonce " + Eth::ToDecimal(tx.nonce) +
                    ", " + std::to_string(tx.data.size()) + " data bytes");
    }
    return tx;
  }

  SafeTransaction LoadTransactionFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) throw LoadError("cannot read file " + path);
    std::ostringstream ss;
    ss << file.rdbuf();
    Logger::Info("Loaded transaction file " + path);
    return ParseTransactionJson(ss.str());
  }
}
