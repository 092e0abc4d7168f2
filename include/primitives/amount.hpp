#pragma once
#include <string>
#include <boost/multiprecision/cpp_int.hpp>

// Token amount in the asset's smallest unit, same width as a uint256 word.
using Amount = boost::multiprecision::uint256_t;

inline const Amount& MaxAmount() {
  static const Amount max = ~Amount(0);
  return max;
}

// Decimal, or hex with 0x prefix. Throws std::invalid_argument on bad digits or values above 2^256-1.
Amount ParseAmount(const std::string& text);
std::string AmountToString(const Amount& amount);
// a + b, throws FlashSwapError(ARITHMETIC_OVERFLOW) instead of wrapping
Amount CheckedAdd(const Amount& a, const Amount& b);
