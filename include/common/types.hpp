#pragma once
#include <array>
#include <string>
#include <vector>
#include <intx/intx.hpp>

using Bytes = std::vector<unsigned char>;
using Hash32 = std::array<unsigned char, 32>;
using Address = std::array<unsigned char, 20>;
using uint256 = intx::uint256;

namespace Eth {
  constexpr Address kZeroAddress{};

  // Accepts 0x-prefixed or bare 40 hex digits in any case. Throws std::invalid_argument.
  Address ParseAddress(const std::string& hex);
  // Decimal or 0x-prefixed hex. Throws std::invalid_argument on bad digits or values above 2^256-1.
  uint256 ParseUint256(const std::string& text);
  // Throws std::invalid_argument unless the input is 0x + 64 hex digits
  Hash32 ParseHash32(const std::string& hex);

  std::string ToHex(const Hash32& h);
  std::string ToHex(const Address& a);
  // EIP-55 mixed-case rendering
  std::string ToChecksumAddress(const Address& a);
  std::string ToDecimal(const uint256& v);
}
