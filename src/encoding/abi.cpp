#include "encoding/abi.hpp"
#include "crypto/keccak.hpp"
#include "utils/hex.hpp"
#include <algorithm>

namespace ABI {
  const char* TypeName(ParamType t) {
    switch (t) {
      case ParamType::ADDRESS: return "address";
      case ParamType::UINT256: return "uint256";
    }
    return "unknown";
  }

  std::string FunctionSpec::Signature() const {
    std::string out = name + "(";
    for (size_t i = 0; i < types.size(); ++i) {
      if (i) out += ",";
      out += TypeName(types[i]);
    }
    out += ")";
    return out;
  }

  std::array<unsigned char, kSelectorSize> SelectorOf(const std::string& signature) {
    Hash32 h = Crypto::Keccak256(signature);
    std::array<unsigned char, kSelectorSize> sel{};
    std::copy(h.begin(), h.begin() + kSelectorSize, sel.begin());
    return sel;
  }

  std::string SelectorHexOf(const std::string& signature) {
    auto sel = SelectorOf(signature);
    return BytesToHex0x(sel.data(), sel.size());
  }

  Encoder& Encoder::WriteBytes32(const Hash32& word) {
    out_.insert(out_.end(), word.begin(), word.end());
    return *this;
  }

  Encoder& Encoder::WriteAddress(const Address& addr) {
    out_.insert(out_.end(), kWordSize - addr.size(), 0);
    out_.insert(out_.end(), addr.begin(), addr.end());
    return *this;
  }

  Encoder& Encoder::WriteUint256(const uint256& v) {
    size_t at = out_.size();
    out_.resize(at + kWordSize);
    intx::be::store(&out_[at], v);
    return *this;
  }

  Encoder& Encoder::WriteUint8(uint8_t v) {
    out_.insert(out_.end(), kWordSize - 1, 0);
    out_.push_back(v);
    return *this;
  }

  Decoder::Decoder(const unsigned char* data, size_t len) : data_(data), len_(len) {}

  Decoder::Decoder(const Bytes& data) : data_(data.data()), len_(data.size()) {}

  const unsigned char* Decoder::NextWord() {
    if (Remaining() < kWordSize) {
      throw DecodeError("data too short: expected " + std::to_string(pos_ + kWordSize) +
                        " bytes of parameters, got " + std::to_string(len_));
    }
    const unsigned char* w = data_ + pos_;
    pos_ += kWordSize;
    return w;
  }

  Address Decoder::ReadAddress() {
    const unsigned char* w = NextWord();
    const size_t pad = kWordSize - Address().size();
    if (std::any_of(w, w + pad, [](unsigned char b){ return b != 0; })) {
      throw DecodeError("address word at offset " + std::to_string(pos_ - kWordSize) + " has non-zero upper bytes");
    }
    Address out{};
    std::copy(w + pad, w + kWordSize, out.begin());
    return out;
  }

  uint256 Decoder::ReadUint256() {
    return intx::be::unsafe::load<uint256>(NextWord());
  }
}
