#pragma once
#include "common/types.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

// Static-type ABI encoding: every value occupies one 32-byte word.
namespace ABI {
  constexpr size_t kWordSize = 32;
  constexpr size_t kSelectorSize = 4;

  class DecodeError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  enum class ParamType { ADDRESS, UINT256 };
  const char* TypeName(ParamType t);

  // A function with static parameters only
  struct FunctionSpec {
    std::string name;
    std::vector<ParamType> types;
    // Canonical form, e.g. "transfer(address,uint256)"
    std::string Signature() const;
  };

  // 0x-prefixed lowercase selector -> function
  using FunctionTable = std::unordered_map<std::string, FunctionSpec>;

  std::array<unsigned char, kSelectorSize> SelectorOf(const std::string& signature);
  // 0x + 8 lowercase hex chars
  std::string SelectorHexOf(const std::string& signature);

  class Encoder {
  public:
    Encoder& WriteBytes32(const Hash32& word);
    // Left-padded with 12 zero bytes
    Encoder& WriteAddress(const Address& addr);
    Encoder& WriteUint256(const uint256& v);
    Encoder& WriteUint8(uint8_t v);
    const Bytes& Data() const { return out_; }
    size_t WordCount() const { return out_.size() / kWordSize; }
  private:
    Bytes out_;
  };

  class Decoder {
  public:
    Decoder(const unsigned char* data, size_t len);
    explicit Decoder(const Bytes& data);
    // Throws DecodeError if the upper 12 bytes of the word are not zero
    Address ReadAddress();
    uint256 ReadUint256();
    size_t Remaining() const { return len_ - pos_; }
  private:
    const unsigned char* NextWord();
    const unsigned char* data_;
    size_t len_;
    size_t pos_ = 0;
  };
}
