#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <algorithm>
#include <cctype>

using Bytes = std::vector<std::uint8_t>;

inline std::string Ensure0x(const std::string& in) {
  if (in.size() >= 2 && (in[0] == '0') && (in[1] == 'x' || in[1] == 'X')) return in;
  return std::string("0x") + in;
}

inline std::string Strip0x(const std::string& s) {
  if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return s.substr(2);
  return s;
}

inline std::string ToLowerHex(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

// Parses hex (with or without 0x). Throws std::invalid_argument on odd length or non-hex digits.
Bytes HexToBytes(const std::string& hex);
// Lowercase hex without prefix.
std::string BytesToHex(const std::uint8_t* data, size_t len);
inline std::string BytesToHex(const Bytes& data) { return BytesToHex(data.data(), data.size()); }
inline std::string BytesToHex0x(const Bytes& data) { return "0x" + BytesToHex(data); }
