#include "common/types.hpp"
#include "crypto/keccak.hpp"
#include "utils/hex.hpp"
#include <algorithm>
#include <stdexcept>

namespace Eth {
  Address ParseAddress(const std::string& hex) {
    std::string digits = Strip0x(hex);
    if (digits.size() != 40 || !IsHexDigits(digits)) {
      throw std::invalid_argument("invalid address (expected 20 bytes of hex): " + hex);
    }
    auto raw = HexToBytes(digits);
    Address out{};
    std::copy(raw.begin(), raw.end(), out.begin());
    return out;
  }

  uint256 ParseUint256(const std::string& text) {
    if (text.empty()) throw std::invalid_argument("empty integer");
    std::string normalized = text;
    if (Has0x(text)) {
      normalized = "0x" + text.substr(2);
      if (normalized.size() == 2) throw std::invalid_argument("invalid integer: " + text);
    }
    try {
      return intx::from_string<uint256>(normalized);
    } catch (const std::out_of_range&) {
      throw std::invalid_argument("integer exceeds 256 bits: " + text);
    } catch (const std::invalid_argument&) {
      throw std::invalid_argument("invalid integer: " + text);
    }
  }

  Hash32 ParseHash32(const std::string& hex) {
    if (!Has0x(hex) || hex.size() != 66 || !IsHexDigits(hex, 2)) {
      throw std::invalid_argument("invalid 32-byte hash: " + hex);
    }
    auto raw = HexToBytes(hex);
    Hash32 out{};
    std::copy(raw.begin(), raw.end(), out.begin());
    return out;
  }

  std::string ToHex(const Hash32& h) { return BytesToHex0x(h.data(), h.size()); }

  std::string ToHex(const Address& a) { return BytesToHex0x(a.data(), a.size()); }

  std::string ToChecksumAddress(const Address& a) {
    std::string lower = BytesToHex(a.data(), a.size());
    Hash32 hash = Crypto::Keccak256(lower);
    std::string out = "0x";
    for (size_t i = 0; i < lower.size(); ++i) {
      char c = lower[i];
      // nibble i of the hash decides the case of hex letter i
      unsigned char nibble = (i % 2 == 0) ? (hash[i / 2] >> 4) : (hash[i / 2] & 0xF);
      if (c >= 'a' && c <= 'f' && nibble >= 8) c = static_cast<char>(c - 'a' + 'A');
      out += c;
    }
    return out;
  }

  std::string ToDecimal(const uint256& v) { return intx::to_string(v); }
}
