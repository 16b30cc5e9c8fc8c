#include "crypto/keccak.hpp"
#include <cryptopp/keccak.h>

namespace {
  class CryptoppKeccak256 : public Crypto::Keccak256Hasher {
  public:
    Hash32 Hash(const unsigned char* data, size_t len) const override {
      // Keccak_256 carries sponge state, so each call gets its own instance
      CryptoPP::Keccak_256 hash;
      Hash32 digest{};
      hash.CalculateDigest(digest.data(), data, len);
      return digest;
    }
  };
}

namespace Crypto {
  std::shared_ptr<const Keccak256Hasher> CreateCryptoppKeccak256() {
    return std::make_shared<CryptoppKeccak256>();
  }

  const std::shared_ptr<const Keccak256Hasher>& DefaultKeccak256() {
    static const std::shared_ptr<const Keccak256Hasher> inst = CreateCryptoppKeccak256();
    return inst;
  }

  Hash32 Keccak256(const Bytes& data) {
    return DefaultKeccak256()->Hash(data.data(), data.size());
  }

  Hash32 Keccak256(const std::string& raw) {
    return DefaultKeccak256()->Hash(reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
  }
}
