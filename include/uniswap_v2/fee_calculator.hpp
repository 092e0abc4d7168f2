#pragma once
#include "primitives/amount.hpp"

// Repayment surcharge of a 0.3% V2 pair. A pair keeps 997/1000 of every input,
// so returning `amount` plus `amount * 3 / 997` (rounded down, plus one unit)
// restores the pair's k.
namespace FeeCalculator {
  inline constexpr unsigned FEE_NUMERATOR = 3;
  inline constexpr unsigned FEE_DENOMINATOR = 997;

  // floor(amount * 3 / 997) + 1, exact for every uint256 amount
  Amount Fee(const Amount& amount);
  // amount + Fee(amount); throws FlashSwapError(ARITHMETIC_OVERFLOW)
  Amount RepayAmount(const Amount& amount);
}
