#pragma once
#include <array>
#include <cstdint>
#include <string>
#include "utils/hex.hpp"

namespace Crypto {
  using Hash256 = std::array<std::uint8_t, 32>;
  using Selector = std::array<std::uint8_t, 4>;

  Hash256 Keccak256(const std::uint8_t* data, size_t len);
  inline Hash256 Keccak256(const Bytes& data) { return Keccak256(data.data(), data.size()); }
  // Returns 0x-prefixed hex keccak256 hash of the input interpreted as raw bytes
  std::string Keccak256Raw(const std::string& raw);
  // First 4 bytes of keccak256 over a canonical function signature, e.g. "transfer(address,uint256)"
  Selector SelectorOf(const std::string& signature);
}
