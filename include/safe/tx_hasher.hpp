#pragma once
#include "safe/safe_tx.hpp"
#include "crypto/keccak.hpp"
#include <memory>

// Computes EIP-712 hashes of a transaction for one fixed domain.
class TransactionHasher {
public:
  virtual ~TransactionHasher() = default;
  virtual const Hash32& DomainHash() const = 0;
  virtual Hash32 MessageHash(const SafeTransaction& tx) const = 0;
  virtual Hash32 FinalHash(const SafeTransaction& tx) const = 0;
  virtual SafeTxHashes AllHashes(const SafeTransaction& tx) const = 0;
};

extern const char* const kDomainSeparatorType;
extern const char* const kSafeTxType;

// Safe 1.3.0 hashing. The type hashes and the domain separator are computed
// once in the constructor; the instance is immutable afterwards.
class SafeTxHasher : public TransactionHasher {
public:
  // Throws std::invalid_argument if keccak is null
  explicit SafeTxHasher(const SafeDomain& domain,
                        std::shared_ptr<const Crypto::Keccak256Hasher> keccak = Crypto::DefaultKeccak256());

  const Hash32& DomainHash() const override { return domain_hash_; }
  // keccak256(abi.encode(SAFE_TX_TYPEHASH, to, value, keccak256(data), operation,
  //   safeTxGas, baseGas, gasPrice, gasToken, refundReceiver, nonce))
  Hash32 MessageHash(const SafeTransaction& tx) const override;
  // keccak256(0x19 || 0x01 || domainSeparator || messageHash)
  Hash32 FinalHash(const SafeTransaction& tx) const override;
  SafeTxHashes AllHashes(const SafeTransaction& tx) const override;

  const SafeTypeHashes& TypeHashes() const { return type_hashes_; }
  const SafeDomain& Domain() const { return domain_; }

private:
  Hash32 Keccak(const Bytes& data) const;
  Hash32 FinalHashOf(const Hash32& message_hash) const;

  std::shared_ptr<const Crypto::Keccak256Hasher> keccak_;
  SafeDomain domain_;
  SafeTypeHashes type_hashes_;
  Hash32 domain_hash_;
};
