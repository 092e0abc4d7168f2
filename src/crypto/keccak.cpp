#include "crypto/keccak.hpp"
#include <algorithm>
#include <cryptopp/keccak.h>

namespace Crypto {
  Hash256 Keccak256(const std::uint8_t* data, size_t len) {
    CryptoPP::Keccak_256 hash;
    Hash256 digest{};
    hash.CalculateTruncatedDigest(digest.data(), digest.size(), data, len);
    return digest;
  }

  std::string Keccak256Raw(const std::string& raw) {
    auto digest = Keccak256(reinterpret_cast<const std::uint8_t*>(raw.data()), raw.size());
    return "0x" + BytesToHex(digest.data(), digest.size());
  }

  Selector SelectorOf(const std::string& signature) {
    auto digest = Keccak256(reinterpret_cast<const std::uint8_t*>(signature.data()), signature.size());
    Selector sel{};
    std::copy(digest.begin(), digest.begin() + 4, sel.begin());
    return sel;
  }
}
