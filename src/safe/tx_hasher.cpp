#include "safe/tx_hasher.hpp"
#include "encoding/abi.hpp"
#include <stdexcept>
#include <string>
#include <utility>

const char* const kDomainSeparatorType = "EIP712Domain(uint256 chainId,address verifyingContract)";
const char* const kSafeTxType =
  "SafeTx(address to,uint256 value,bytes data,uint8 operation,uint256 safeTxGas,uint256 baseGas,"
  "uint256 gasPrice,address gasToken,address refundReceiver,uint256 nonce)";

namespace {
  // EIP-191 version byte 0x01 (structured data), after the 0x19 prefix
  constexpr unsigned char kEip191Prefix = 0x19;
  constexpr unsigned char kEip712Version = 0x01;

  Bytes RawBytes(const char* s) {
    const std::string str(s);
    return Bytes(str.begin(), str.end());
  }
}

SafeTxHasher::SafeTxHasher(const SafeDomain& domain, std::shared_ptr<const Crypto::Keccak256Hasher> keccak)
  : keccak_(std::move(keccak)), domain_(domain) {
  if (!keccak_) throw std::invalid_argument("SafeTxHasher requires a keccak256 implementation");
  type_hashes_.domain_separator_type_hash = Keccak(RawBytes(kDomainSeparatorType));
  type_hashes_.safe_tx_type_hash = Keccak(RawBytes(kSafeTxType));

  ABI::Encoder enc;
  enc.WriteBytes32(type_hashes_.domain_separator_type_hash)
     .WriteUint256(domain_.chain_id)
     .WriteAddress(domain_.verifying_contract);
  domain_hash_ = Keccak(enc.Data());
}

Hash32 SafeTxHasher::Keccak(const Bytes& data) const {
  return keccak_->Hash(data.data(), data.size());
}

Hash32 SafeTxHasher::MessageHash(const SafeTransaction& tx) const {
  if (tx.operation != SafeOperation::CALL && tx.operation != SafeOperation::DELEGATE_CALL) {
    throw std::invalid_argument("invalid operation: " + std::to_string(static_cast<int>(tx.operation)));
  }
  ABI::Encoder enc;
  enc.WriteBytes32(type_hashes_.safe_tx_type_hash)
     .WriteAddress(tx.to)
     .WriteUint256(tx.value)
     .WriteBytes32(Keccak(tx.data))
     .WriteUint8(static_cast<uint8_t>(tx.operation))
     .WriteUint256(tx.safe_tx_gas)
     .WriteUint256(tx.base_gas)
     .WriteUint256(tx.gas_price)
     .WriteAddress(tx.gas_token)
     .WriteAddress(tx.refund_receiver)
     .WriteUint256(tx.nonce);
  return Keccak(enc.Data());
}

Hash32 SafeTxHasher::FinalHashOf(const Hash32& message_hash) const {
  Bytes packed;
  packed.reserve(2 + 2 * ABI::kWordSize);
  packed.push_back(kEip191Prefix);
  packed.push_back(kEip712Version);
  packed.insert(packed.end(), domain_hash_.begin(), domain_hash_.end());
  packed.insert(packed.end(), message_hash.begin(), message_hash.end());
  return Keccak(packed);
}

Hash32 SafeTxHasher::FinalHash(const SafeTransaction& tx) const {
  return FinalHashOf(MessageHash(tx));
}

SafeTxHashes SafeTxHasher::AllHashes(const SafeTransaction& tx) const {
  SafeTxHashes out;
  out.domain_hash = domain_hash_;
  out.message_hash = MessageHash(tx);
  out.final_hash = FinalHashOf(out.message_hash);
  return out;
}
