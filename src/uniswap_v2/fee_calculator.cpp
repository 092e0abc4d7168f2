#include "uniswap_v2/fee_calculator.hpp"

namespace FeeCalculator {
  Amount Fee(const Amount& amount) {
    // amount = q*997 + r, so amount*3/997 = 3q + 3r/997 without forming amount*3
    Amount q = amount / FEE_DENOMINATOR;
    Amount r = amount % FEE_DENOMINATOR;
    return q * FEE_NUMERATOR + (r * FEE_NUMERATOR) / FEE_DENOMINATOR + 1;
  }

  Amount RepayAmount(const Amount& amount) {
    return CheckedAdd(amount, Fee(amount));
  }
}
