#include <catch2/catch.hpp>
#include "fakes.hpp"
#include "crypto/keccak.hpp"
#include "primitives/address.hpp"
#include "primitives/amount.hpp"
#include <stdexcept>

TEST_CASE("Keccak-256 digests and selectors", "[crypto]") {
  REQUIRE(Crypto::Keccak256Raw("") == "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");

  auto hex = [](const Crypto::Selector& s){ return BytesToHex(s.data(), s.size()); };
  REQUIRE(hex(Crypto::SelectorOf("uniswapV2Call(address,uint256,uint256,bytes)")) == "10d1e85c");
  REQUIRE(hex(Crypto::SelectorOf("swap(uint256,uint256,address,bytes)")) == "022c0d9f");
  REQUIRE(hex(Crypto::SelectorOf("getPair(address,address)")) == "e6a43905");
  REQUIRE(hex(Crypto::SelectorOf("token0()")) == "0dfe1681");
  REQUIRE(hex(Crypto::SelectorOf("token1()")) == "d21220a7");
  REQUIRE(hex(Crypto::SelectorOf("transfer(address,uint256)")) == "a9059cbb");
}

TEST_CASE("Address parsing and formatting", "[address]") {
  SECTION("Accepts any case with or without prefix") {
    Address a = Addr("0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2");
    Address b = Addr("C02AAA39B223FE8D0A0E5C4F27EAD9083C756CC2");
    REQUIRE(a == b);
    REQUIRE(a.ToHex() == "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2");
  }
  SECTION("Rejects wrong length and non-hex") {
    REQUIRE_THROWS_AS(Address::FromHex("0x1234"), std::invalid_argument);
    REQUIRE_THROWS_AS(Address::FromHex("0xzz2aaa39b223fe8d0a0e5c4f27ead9083c756cc2"), std::invalid_argument);
  }
  SECTION("Zero address") {
    REQUIRE(Address().IsZero());
    REQUIRE_FALSE(Addr(MainnetConstants::WETH).IsZero());
  }
  SECTION("EIP-55 checksums") {
    REQUIRE(Addr(MainnetConstants::WETH).ToChecksumHex() == MainnetConstants::WETH);
    REQUIRE(Addr(MainnetConstants::DAI).ToChecksumHex() == MainnetConstants::DAI);
    REQUIRE(Addr(MainnetConstants::USDC).ToChecksumHex() == MainnetConstants::USDC);
  }
}

TEST_CASE("Address order is numeric", "[address]") {
  REQUIRE(Addr(MainnetConstants::USDC) < Addr(MainnetConstants::WETH));
  REQUIRE(Addr(MainnetConstants::DAI) < Addr(MainnetConstants::WETH));
  REQUIRE(AddrWithLead(0x01, 0xff) < AddrWithLead(0x02, 0x00));
  REQUIRE_FALSE(AddrWithLead(0x02) < AddrWithLead(0x02));
}

TEST_CASE("Amount parsing", "[amount]") {
  REQUIRE(ParseAmount("1000000") == 1000000);
  REQUIRE(ParseAmount("0x0f4240") == 1000000);
  REQUIRE(ParseAmount("115792089237316195423570985008687907853269984665640564039457584007913129639935") == MaxAmount());
  REQUIRE_THROWS_AS(ParseAmount("115792089237316195423570985008687907853269984665640564039457584007913129639936"), std::invalid_argument);
  REQUIRE_THROWS_AS(ParseAmount("-5"), std::invalid_argument);
  REQUIRE_THROWS_AS(ParseAmount("12e3"), std::invalid_argument);
  REQUIRE_THROWS_AS(ParseAmount(""), std::invalid_argument);
  REQUIRE(AmountToString(Amount(1003010)) == "1003010");
}
