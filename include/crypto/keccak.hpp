#pragma once
#include "common/types.hpp"
#include <cstddef>
#include <memory>
#include <string>

namespace Crypto {
  // keccak256 primitive (Keccak padding 0x01, not the NIST SHA3-256 0x06)
  class Keccak256Hasher {
  public:
    virtual ~Keccak256Hasher() = default;
    virtual Hash32 Hash(const unsigned char* data, size_t len) const = 0;
  };

  // Crypto++ Keccak_256 backend. Stateless, safe to share across threads.
  std::shared_ptr<const Keccak256Hasher> CreateCryptoppKeccak256();
  // Process-wide instance of the Crypto++ backend
  const std::shared_ptr<const Keccak256Hasher>& DefaultKeccak256();

  Hash32 Keccak256(const Bytes& data);
  // Hashes the raw characters of the string (e.g. a type or function signature)
  Hash32 Keccak256(const std::string& raw);
}
