#include "safe/data_decoder.hpp"
#include "protocols/erc20.hpp"
#include "utils/hex.hpp"
#include <stdexcept>
#include <utility>

namespace {
  constexpr size_t kMaxFormattedLength = 100;

  struct CodePoint { size_t offset; size_t length; char32_t value; };

  // Strict UTF-8: rejects overlong forms, surrogates, values above U+10FFFF
  // and truncated sequences.
  std::vector<CodePoint> DecodeUtf8(const Bytes& in) {
    std::vector<CodePoint> out;
    size_t i = 0;
    while (i < in.size()) {
      unsigned char b = in[i];
      size_t len = 0; char32_t cp = 0; char32_t min = 0;
      if (b < 0x80) { len = 1; cp = b; }
      else if ((b & 0xE0) == 0xC0) { len = 2; cp = b & 0x1F; min = 0x80; }
      else if ((b & 0xF0) == 0xE0) { len = 3; cp = b & 0x0F; min = 0x800; }
      else if ((b & 0xF8) == 0xF0) { len = 4; cp = b & 0x07; min = 0x10000; }
      else throw std::runtime_error("invalid UTF-8 start byte at offset " + std::to_string(i));
      if (i + len > in.size()) throw std::runtime_error("truncated UTF-8 sequence at offset " + std::to_string(i));
      for (size_t k = 1; k < len; ++k) {
        unsigned char c = in[i + k];
        if ((c & 0xC0) != 0x80) throw std::runtime_error("invalid UTF-8 continuation byte at offset " + std::to_string(i + k));
        cp = (cp << 6) | (c & 0x3F);
      }
      if (len > 1 && cp < min) throw std::runtime_error("overlong UTF-8 sequence at offset " + std::to_string(i));
      if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        throw std::runtime_error("invalid UTF-8 code point at offset " + std::to_string(i));
      }
      out.push_back({i, len, cp});
      i += len;
    }
    return out;
  }

  // White space and line terminators as ECMAScript String.prototype.trim sees them
  bool IsTrimmable(char32_t c) {
    if ((c >= 0x09 && c <= 0x0D) || c == 0x20 || c == 0xA0 || c == 0x1680) return true;
    if (c >= 0x2000 && c <= 0x200A) return true;
    return c == 0x2028 || c == 0x2029 || c == 0x202F || c == 0x205F || c == 0x3000 || c == 0xFEFF;
  }

  std::string Utf8ToTrimmedText(const Bytes& in) {
    auto cps = DecodeUtf8(in);
    size_t first = 0, last = cps.size();
    while (first < last && IsTrimmable(cps[first].value)) ++first;
    while (last > first && IsTrimmable(cps[last - 1].value)) --last;
    if (first == last) return std::string();
    size_t begin = cps[first].offset;
    size_t end = cps[last - 1].offset + cps[last - 1].length;
    std::string text;
    text.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
      if (in[i] != 0) text.push_back(static_cast<char>(in[i]));
    }
    return text;
  }

  DecodedFunctionResult Failure(const std::string& error) {
    DecodedFunctionResult r;
    r.success = false;
    r.error = error;
    return r;
  }
}

TransactionDataDecoder::TransactionDataDecoder() : functions_(ERC20::KnownFunctions()) {}

TransactionDataDecoder::TransactionDataDecoder(ABI::FunctionTable functions) : functions_(std::move(functions)) {}

ValidationResult TransactionDataDecoder::ValidateHexData(const std::string& data) const {
  if (data.empty()) return {false, std::string("Data is empty")};
  if (data.rfind("0x", 0) != 0) return {false, std::string("Hex data must start with 0x")};
  if (!IsHexDigits(data, 2)) return {false, std::string("Data contains invalid hex characters")};
  if ((data.size() - 2) % 2 != 0) return {false, std::string("Hex data must have even length")};
  return {true, std::nullopt};
}

DecodedResult TransactionDataDecoder::DecodeAsciiData(const std::string& encoded) const {
  auto validation = ValidateHexData(encoded);
  if (!validation.valid) return {false, "", validation.error};
  if (encoded.size() < 2 + 2 * ABI::kWordSize) {
    return {false, "", std::string("Data too short, minimum 32 bytes required")};
  }
  Bytes payload = HexToBytes(encoded.substr(2 + 2 * ABI::kWordSize));
  try {
    return {true, Utf8ToTrimmedText(payload), std::nullopt};
  } catch (const std::runtime_error& e) {
    return {false, "", std::string("Failed to decode data: ") + e.what()};
  }
}

DecodedFunctionResult TransactionDataDecoder::DecodeFunctionCall(const std::string& encoded) const {
  auto validation = ValidateHexData(encoded);
  if (!validation.valid) return Failure(*validation.error);
  if (encoded.size() < 2 + 2 * ABI::kSelectorSize) {
    return Failure("Data too short, minimum 4 bytes required for function selector");
  }

  DecodedFunctionResult r;
  r.success = true;
  // Case-insensitive: 0xA9059CBB... matches transfer and is reported lowercase
  const std::string selector = ToLowerHex(encoded.substr(0, 2 + 2 * ABI::kSelectorSize));
  r.signature = selector;

  auto it = functions_.find(selector);
  if (it == functions_.end()) {
    r.value = selector;
    return r;
  }

  const ABI::FunctionSpec& fn = it->second;
  r.name = fn.name;
  Bytes args = HexToBytes(encoded.substr(2 + 2 * ABI::kSelectorSize));
  try {
    ABI::Decoder dec(args);
    std::vector<DecodedParam> params;
    params.reserve(fn.types.size());
    for (ABI::ParamType t : fn.types) {
      switch (t) {
        case ABI::ParamType::ADDRESS: params.push_back({t, Eth::ToChecksumAddress(dec.ReadAddress())}); break;
        case ABI::ParamType::UINT256: params.push_back({t, Eth::ToDecimal(dec.ReadUint256())}); break;
      }
    }
    r.value = fn.Signature();
    r.params = std::move(params);
  } catch (const ABI::DecodeError& e) {
    // TODO: report this as a failure once callers stop relying on success=true here
    r.value = fn.name;
    r.error = std::string("Identified function but failed to decode parameters: ") + e.what();
  }
  return r;
}

std::string TransactionDataDecoder::FormatDecodedData(const DecodedResult& decoded) {
  if (!decoded.success) return "Decoding Error: " + decoded.error.value_or("");
  // Length is in UTF-8 code points; the cut lands before the lead byte of the 101st
  size_t chars = 0;
  for (size_t i = 0; i < decoded.value.size(); ++i) {
    if ((static_cast<unsigned char>(decoded.value[i]) & 0xC0) == 0x80) continue;
    if (chars++ == kMaxFormattedLength) return decoded.value.substr(0, i) + "...";
  }
  return decoded.value;
}
