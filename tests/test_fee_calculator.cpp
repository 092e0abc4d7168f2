#include <catch2/catch.hpp>
#include "fakes.hpp"
#include "uniswap_v2/fee_calculator.hpp"

using FeeCalculator::Fee;
using FeeCalculator::RepayAmount;

TEST_CASE("Fee matches floor(amount * 3 / 997) + 1", "[fee]") {
  SECTION("Zero amount still pays one unit") {
    REQUIRE(Fee(0) == 1);
  }
  SECTION("Exact multiple of 997") {
    REQUIRE(Fee(997) == 4);
  }
  SECTION("Round amounts") {
    REQUIRE(Fee(1000) == 4);
    REQUIRE(Fee(1000000) == 3010);
    REQUIRE(Fee(Amount("1000000000000000000")) == Amount("3009027081243732"));
  }
  SECTION("Below the first whole fee unit") {
    REQUIRE(Fee(332) == 1);
    REQUIRE(Fee(333) == 2);
  }
}

TEST_CASE("Fee is at least one and non-decreasing", "[fee]") {
  Amount previous = Fee(0);
  for (unsigned i = 1; i < 5000; ++i) {
    Amount f = Fee(i);
    REQUIRE(f >= 1);
    REQUIRE(f >= previous);
    previous = f;
  }
}

TEST_CASE("Fee is exact across the full uint256 range", "[fee]") {
  const Amount max = MaxAmount();
  boost::multiprecision::cpp_int wide(max);
  Amount expected = static_cast<Amount>(wide * 3 / 997 + 1);
  REQUIRE(Fee(max) == expected);
  REQUIRE(Fee(max - 1) <= Fee(max));
}

TEST_CASE("RepayAmount adds the fee with overflow checking", "[fee]") {
  REQUIRE(RepayAmount(1000000) == 1003010);
  REQUIRE(RepayAmount(1000) == 1004);

  REQUIRE(CaughtCode([]{ RepayAmount(MaxAmount()); }) == ErrorCode::ARITHMETIC_OVERFLOW);
  // largest amount whose repayment still fits
  const Amount max = MaxAmount();
  Amount fits = max - Fee(max);
  REQUIRE_NOTHROW(RepayAmount(fits - 1));
}
