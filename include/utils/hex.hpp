#pragma once
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <stdexcept>

inline bool Has0x(const std::string& s) {
  return s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

inline std::string Strip0x(const std::string& s) {
  if (Has0x(s)) return s.substr(2);
  return s;
}

inline std::string ToLowerHex(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

// -1 for a non-hex character
inline int HexDigitValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + c - 'a';
  if (c >= 'A' && c <= 'F') return 10 + c - 'A';
  return -1;
}

inline bool IsHexDigits(const std::string& s, size_t from = 0) {
  for (size_t i = from; i < s.size(); ++i) if (HexDigitValue(s[i]) < 0) return false;
  return true;
}

// Strict: optional 0x prefix, even number of hex digits. Throws std::invalid_argument otherwise.
inline std::vector<unsigned char> HexToBytes(const std::string& hex) {
  size_t start = Has0x(hex) ? 2 : 0;
  if ((hex.size() - start) % 2 != 0) throw std::invalid_argument("hex string has odd length: " + hex);
  std::vector<unsigned char> out; out.reserve((hex.size() - start) / 2);
  for (size_t i = start; i < hex.size(); i += 2) {
    int hi = HexDigitValue(hex[i]), lo = HexDigitValue(hex[i + 1]);
    if (hi < 0 || lo < 0) throw std::invalid_argument("invalid hex character in: " + hex);
    out.push_back(static_cast<unsigned char>((hi << 4) | lo));
  }
  return out;
}

inline std::string BytesToHex(const unsigned char* data, size_t len) {
  static const char* hex = "0123456789abcdef";
  std::string out; out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) { unsigned char b = data[i]; out += hex[b >> 4]; out += hex[b & 0xF]; }
  return out;
}

inline std::string BytesToHex0x(const unsigned char* data, size_t len) {
  return "0x" + BytesToHex(data, len);
}

inline std::string BytesToHex0x(const std::vector<unsigned char>& data) {
  return BytesToHex0x(data.data(), data.size());
}
