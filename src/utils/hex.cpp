#include "utils/hex.hpp"
#include <stdexcept>

static int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + c - 'a';
  if (c >= 'A' && c <= 'F') return 10 + c - 'A';
  return -1;
}

Bytes HexToBytes(const std::string& hex) {
  std::string s = Strip0x(hex);
  if (s.size() % 2 != 0) throw std::invalid_argument("odd-length hex: " + hex);
  Bytes out; out.reserve(s.size() / 2);
  for (size_t i = 0; i < s.size(); i += 2) {
    int hi = HexDigit(s[i]);
    int lo = HexDigit(s[i + 1]);
    if (hi < 0 || lo < 0) throw std::invalid_argument("invalid hex digit in: " + hex);
    out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::string BytesToHex(const std::uint8_t* data, size_t len) {
  static const char* hex = "0123456789abcdef";
  std::string out; out.reserve(2 * len);
  for (size_t i = 0; i < len; ++i) { out += hex[data[i] >> 4]; out += hex[data[i] & 0xF]; }
  return out;
}
