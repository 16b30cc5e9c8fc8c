#include "safe/tx_hasher.hpp"
#include "utils/hex.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace {
  // Linea mainnet Safe used for the reference vectors
  SafeDomain LineaDomain() {
    SafeDomain d;
    d.chain_id = 59144;
    d.verifying_contract = Eth::ParseAddress("0xDb73ba19F072D0Fbc865781Ba468A9F8B77aD2C4");
    return d;
  }

  const char* kTransferData =
    "0xa9059cbb0000000000000000000000008b4b268a9aa797fd60889e88ac7be9a0c4b37ff4"
    "0000000000000000000000000000000000000000000000000000000511b5ac00";

  // USDC transfer of 0x511b5ac00 to 0x8b4B...7Ff4, nonce 60
  SafeTransaction TokenTransfer(const char* to) {
    SafeTransaction tx;
    tx.to = Eth::ParseAddress(to);
    tx.data = HexToBytes(kTransferData);
    tx.nonce = 60;
    return tx;
  }

  class CountingKeccak : public Crypto::Keccak256Hasher {
  public:
    Hash32 Hash(const unsigned char* data, size_t len) const override {
      ++calls;
      return Crypto::DefaultKeccak256()->Hash(data, len);
    }
    mutable std::atomic<int> calls{0};
  };
}

TEST(SafeTxHasher, TypeHashes) {
  SafeTxHasher hasher(LineaDomain());
  EXPECT_EQ(Eth::ToHex(hasher.TypeHashes().domain_separator_type_hash),
            "0x47e79534a245952e8b16893a336b85a3d9ea9fa8c573f3d803afb92a79469218");
  EXPECT_EQ(Eth::ToHex(hasher.TypeHashes().safe_tx_type_hash),
            "0xbb8310d486368db6bd6f849402fdd73ad53d316b5a4b2644ad6efe0f941286d8");
}

TEST(SafeTxHasher, GoldenVectorTokenTransfer) {
  SafeTxHasher hasher(LineaDomain());
  auto hashes = hasher.AllHashes(TokenTransfer("0x176211869ca2b568f2a7d4ee941e073a821ee1ff"));
  EXPECT_EQ(Eth::ToHex(hashes.domain_hash), "0x7ae3819992af9cb3416bfbfc483b427868cec8257ab807445212b48a5ca86dfd");
  EXPECT_EQ(Eth::ToHex(hashes.message_hash), "0xd7a20bc0e18961ef47e55f868cdcd8d41a58bb689ee1837dafe8aa99a588494a");
  EXPECT_EQ(Eth::ToHex(hashes.final_hash), "0x64b865a13a4d2968c6f6428a4403a2df33c35171d482322238bbac22698e6189");
}

TEST(SafeTxHasher, GoldenVectorRecipientAsTarget) {
  SafeTxHasher hasher(LineaDomain());
  auto hashes = hasher.AllHashes(TokenTransfer("0x8b4B268a9aA797fD60889E88AC7bE9a0C4b37Ff4"));
  EXPECT_EQ(Eth::ToHex(hashes.domain_hash), "0x7ae3819992af9cb3416bfbfc483b427868cec8257ab807445212b48a5ca86dfd");
  EXPECT_EQ(Eth::ToHex(hashes.message_hash), "0x08de308016c0bd5b24628c18ab9d28b3f129a9aa9f40900f6fc622f82bb194a9");
  EXPECT_EQ(Eth::ToHex(hashes.final_hash), "0x1c8bb9fdc4d957f77da17bb7ac5f42a9c89b334c88fcf6195968d4a974c46a84");
}

TEST(SafeTxHasher, DefaultTransactionOnMainnetZeroAddress) {
  SafeDomain d;
  SafeTxHasher hasher(d);
  EXPECT_EQ(Eth::ToHex(hasher.DomainHash()), "0x3539ff6fa186b54971829bd64f8209288750abdac2c4fda00762aa4e6cb32950");
  EXPECT_EQ(Eth::ToHex(hasher.MessageHash(SafeTransaction{})),
            "0x01a22fd9edfa56e80e83dfe6249e4cb5afc6f92147491f8e055b3f94d372bd4f");
}

TEST(SafeTxHasher, FinalHashIsPrefixedKeccakOfDomainAndMessage) {
  SafeTxHasher hasher(LineaDomain());
  auto tx = TokenTransfer("0x176211869ca2b568f2a7d4ee941e073a821ee1ff");
  Hash32 message = hasher.MessageHash(tx);
  Bytes packed{0x19, 0x01};
  packed.insert(packed.end(), hasher.DomainHash().begin(), hasher.DomainHash().end());
  packed.insert(packed.end(), message.begin(), message.end());
  EXPECT_EQ(hasher.FinalHash(tx), Crypto::Keccak256(packed));
  EXPECT_EQ(hasher.AllHashes(tx).final_hash, Crypto::Keccak256(packed));
}

TEST(SafeTxHasher, DeterministicAcrossInstances) {
  auto tx = TokenTransfer("0x176211869ca2b568f2a7d4ee941e073a821ee1ff");
  SafeTxHasher a(LineaDomain());
  SafeTxHasher b(LineaDomain(), Crypto::CreateCryptoppKeccak256());
  EXPECT_EQ(a.MessageHash(tx), a.MessageHash(tx));
  EXPECT_EQ(a.MessageHash(tx), b.MessageHash(tx));
  EXPECT_EQ(a.FinalHash(tx), b.FinalHash(tx));
  EXPECT_EQ(a.DomainHash(), b.DomainHash());
}

TEST(SafeTxHasher, MessageHashChangesWithEachField) {
  SafeTxHasher hasher(LineaDomain());
  const auto base = TokenTransfer("0x176211869ca2b568f2a7d4ee941e073a821ee1ff");
  const Hash32 h = hasher.MessageHash(base);

  auto tx = base; tx.data[10] ^= 0x01;
  EXPECT_NE(hasher.MessageHash(tx), h);
  tx = base; tx.value = tx.value ^ uint256(1);
  EXPECT_NE(hasher.MessageHash(tx), h);
  tx = base; tx.operation = SafeOperation::DELEGATE_CALL;
  EXPECT_NE(hasher.MessageHash(tx), h);
  tx = base; tx.nonce = 61;
  EXPECT_NE(hasher.MessageHash(tx), h);
  tx = base; tx.safe_tx_gas = 1;
  EXPECT_NE(hasher.MessageHash(tx), h);
  tx = base; tx.base_gas = 1;
  EXPECT_NE(hasher.MessageHash(tx), h);
  tx = base; tx.gas_price = 1;
  EXPECT_NE(hasher.MessageHash(tx), h);
  tx = base; tx.gas_token[19] = 1;
  EXPECT_NE(hasher.MessageHash(tx), h);
  tx = base; tx.refund_receiver[0] = 1;
  EXPECT_NE(hasher.MessageHash(tx), h);
  tx = base; tx.to[5] ^= 0xFF;
  EXPECT_NE(hasher.MessageHash(tx), h);
}

TEST(SafeTxHasher, MessageHashIgnoresDomain) {
  SafeDomain other = LineaDomain();
  other.chain_id = 1;
  SafeTxHasher a(LineaDomain());
  SafeTxHasher b(other);
  auto tx = TokenTransfer("0x176211869ca2b568f2a7d4ee941e073a821ee1ff");
  EXPECT_EQ(a.MessageHash(tx), b.MessageHash(tx));
  EXPECT_NE(a.DomainHash(), b.DomainHash());
  EXPECT_NE(a.FinalHash(tx), b.FinalHash(tx));
  EXPECT_EQ(a.Domain().chain_id, uint256(59144));
  EXPECT_EQ(b.Domain().chain_id, uint256(1));
  EXPECT_EQ(b.Domain().verifying_contract, a.Domain().verifying_contract);
}

TEST(SafeTxHasher, LargeIntegersEncodeAsFullWords) {
  SafeTxHasher hasher(LineaDomain());
  SafeTransaction a;
  a.value = ~uint256(0);
  SafeTransaction b = a;
  b.value = ~uint256(0) - 1;
  EXPECT_NE(hasher.MessageHash(a), hasher.MessageHash(b));
}

TEST(SafeTxHasher, DomainHashComputedOnceAtConstruction) {
  auto counting = std::make_shared<CountingKeccak>();
  SafeTxHasher hasher(LineaDomain(), counting);
  // two type hashes and the domain separator
  EXPECT_EQ(counting->calls.load(), 3);
  auto tx = TokenTransfer("0x176211869ca2b568f2a7d4ee941e073a821ee1ff");
  hasher.AllHashes(tx);
  // keccak(data), struct hash, final hash
  EXPECT_EQ(counting->calls.load(), 6);
  EXPECT_EQ(Eth::ToHex(hasher.DomainHash()), "0x7ae3819992af9cb3416bfbfc483b427868cec8257ab807445212b48a5ca86dfd");
}

TEST(SafeTxHasher, RejectsNullKeccak) {
  EXPECT_THROW({ SafeTxHasher hasher(LineaDomain(), nullptr); }, std::invalid_argument);
}

TEST(SafeTxHasher, RejectsUnknownOperation) {
  SafeTxHasher hasher(LineaDomain());
  SafeTransaction tx;
  tx.operation = static_cast<SafeOperation>(2);
  EXPECT_THROW(hasher.MessageHash(tx), std::invalid_argument);
}

TEST(SafeTxHasher, UsableThroughInterfaceFromManyThreads) {
  std::unique_ptr<TransactionHasher> hasher(new SafeTxHasher(LineaDomain()));
  const auto tx = TokenTransfer("0x176211869ca2b568f2a7d4ee941e073a821ee1ff");
  const Hash32 expected = hasher->FinalHash(tx);
  std::atomic<int> mismatches{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&]{
      for (int i = 0; i < 50; ++i) if (hasher->FinalHash(tx) != expected) ++mismatches;
    });
  }
  for (auto& th : threads) th.join();
  EXPECT_EQ(mismatches.load(), 0);
}
