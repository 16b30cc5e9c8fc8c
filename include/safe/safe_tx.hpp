#pragma once
#include "common/types.hpp"
#include <cstdint>

enum class SafeOperation : uint8_t { CALL = 0, DELEGATE_CALL = 1 };

// Fields of the SafeTx EIP-712 struct (Safe 1.3.0)
struct SafeTransaction {
  Address to{};
  uint256 value = 0; // wei
  Bytes data;
  SafeOperation operation = SafeOperation::CALL;
  uint256 safe_tx_gas = 0;
  uint256 base_gas = 0;
  uint256 gas_price = 0;
  Address gas_token{};       // zero address: native asset
  Address refund_receiver{}; // zero address: tx.origin
  uint256 nonce = 0;
};

struct SafeDomain {
  uint256 chain_id = 1;
  Address verifying_contract{};
};

struct SafeTypeHashes {
  Hash32 domain_separator_type_hash{};
  Hash32 safe_tx_type_hash{};
};

struct SafeTxHashes {
  Hash32 domain_hash{};
  Hash32 message_hash{}; // struct hash, "safeTxHash" in the contract
  Hash32 final_hash{};   // what the signer signs, "safeTxHash" in the Safe UI
};
