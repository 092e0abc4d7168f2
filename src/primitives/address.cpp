#include "primitives/address.hpp"
#include "crypto/keccak.hpp"
#include "utils/hex.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

Address Address::FromHex(const std::string& hex) {
  std::string body = Strip0x(hex);
  if (body.size() != kSize * 2) throw std::invalid_argument("address must be 20 bytes: " + hex);
  ::Bytes raw = HexToBytes(body);
  Raw out{};
  std::copy(raw.begin(), raw.end(), out.begin());
  return Address(out);
}

bool Address::IsZero() const {
  return std::all_of(bytes_.begin(), bytes_.end(), [](std::uint8_t b){ return b == 0; });
}

std::string Address::ToHex() const {
  return "0x" + BytesToHex(bytes_.data(), bytes_.size());
}

std::string Address::ToChecksumHex() const {
  std::string lower = BytesToHex(bytes_.data(), bytes_.size());
  auto hash = Crypto::Keccak256(reinterpret_cast<const std::uint8_t*>(lower.data()), lower.size());
  std::string out = "0x";
  out.reserve(2 + lower.size());
  for (size_t i = 0; i < lower.size(); ++i) {
    std::uint8_t nibble = (i % 2 == 0) ? (hash[i / 2] >> 4) : (hash[i / 2] & 0xF);
    char c = lower[i];
    out += (std::isalpha(static_cast<unsigned char>(c)) && nibble >= 8)
      ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
  }
  return out;
}
