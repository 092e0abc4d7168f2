#include <catch2/catch.hpp>
#include "fakes.hpp"
#include "config/network.hpp"
#include "uniswap_v2/callback_settler.hpp"
#include "uniswap_v2/fee_calculator.hpp"

namespace {
  struct SettlerFixture {
    NetworkRegistry networks = DefaultNetworkRegistry();
    FakePairGateway gateway;
    CallbackSettler settler{networks, gateway};
    const Address borrower = Addr("0x1111111111111111111111111111111111111111");
    const Address usdc = Addr(MainnetConstants::USDC);
    const Address weth = Addr(MainnetConstants::WETH);
    const Address pair = Addr(MainnetConstants::USDC_WETH_PAIR);
    const LoanContext ctx{MainnetConstants::CHAIN_ID, PoolHandle::FromExplicit(pair), usdc, borrower};

    SettlerFixture() {
      gateway.AddPair(Addr(MainnetConstants::UNISWAP_V2_FACTORY), pair, usdc, weth);
    }

    Bytes Callback(const Amount& amount0, const Amount& amount1, const Address& initiator) const {
      FlashSwapABI::CallbackPayload p{initiator, amount0, amount1, Bytes{0x01}};
      return FlashSwapABI::EncodeCallback(Crypto::SelectorOf(FlashSwapABI::CALLBACK_SIGNATURE), p);
    }
  };
}

TEST_CASE_METHOD(SettlerFixture, "Repays token0 loans to the pair with the fee", "[settler]") {
  auto transfers = settler.Settle(ctx, pair, Callback(Amount(1000000), Amount(0), borrower));
  REQUIRE(transfers.size() == 1);
  REQUIRE(transfers[0].asset == usdc);
  REQUIRE(transfers[0].to == pair);
  REQUIRE(transfers[0].amount == 1003010);
}

TEST_CASE_METHOD(SettlerFixture, "Repays token1 loans", "[settler]") {
  Amount one_eth = ParseAmount("1000000000000000000");
  auto transfers = settler.Settle(ctx, pair, Callback(Amount(0), one_eth, borrower));
  REQUIRE(transfers.size() == 1);
  REQUIRE(transfers[0].asset == weth);
  REQUIRE(transfers[0].amount == one_eth + FeeCalculator::Fee(one_eth));
}

TEST_CASE_METHOD(SettlerFixture, "Both slots borrowed repays slot1 first", "[settler]") {
  auto transfers = settler.Settle(ctx, pair, Callback(Amount(997), Amount(1000), borrower));
  REQUIRE(transfers.size() == 2);
  REQUIRE(transfers[0].asset == weth);
  REQUIRE(transfers[0].amount == 1004);
  REQUIRE(transfers[1].asset == usdc);
  REQUIRE(transfers[1].amount == 1001);
}

TEST_CASE_METHOD(SettlerFixture, "Nothing borrowed means nothing to repay", "[settler]") {
  auto transfers = settler.Settle(ctx, pair, Callback(Amount(0), Amount(0), borrower));
  REQUIRE(transfers.empty());
  REQUIRE(gateway.token_calls == 0);
}

TEST_CASE_METHOD(SettlerFixture, "Verify returns the decoded arguments", "[settler]") {
  auto payload = settler.Verify(ctx, pair, Callback(Amount(7), Amount(0), borrower));
  REQUIRE(payload.initiator == borrower);
  REQUIRE(payload.amount0 == 7);
  REQUIRE(payload.amount1 == 0);
  REQUIRE(payload.extra_params == Bytes{0x01});
}

TEST_CASE_METHOD(SettlerFixture, "Rejected callbacks", "[settler]") {
  SECTION("sender is not the loan pair") {
    Address impostor = Addr("0x3333333333333333333333333333333333333333");
    REQUIRE(CaughtCode([&]{ settler.Settle(ctx, impostor, Callback(Amount(1), Amount(0), borrower)); })
            == ErrorCode::POOL_MISMATCH);
  }
  SECTION("swap initiated by someone else") {
    Address other = Addr("0x4444444444444444444444444444444444444444");
    REQUIRE(CaughtCode([&]{ settler.Settle(ctx, pair, Callback(Amount(1), Amount(0), other)); })
            == ErrorCode::INVALID_CALLBACK);
  }
  SECTION("wrong selector") {
    FlashSwapABI::CallbackPayload p{borrower, Amount(1), Amount(0), Bytes{0x01}};
    Bytes data = FlashSwapABI::EncodeCallback(Crypto::SelectorOf("pancakeCall(address,uint256,uint256,bytes)"), p);
    REQUIRE(CaughtCode([&]{ settler.Settle(ctx, pair, data); }) == ErrorCode::INVALID_CALLBACK);
  }
  SECTION("shorter than a selector") {
    REQUIRE(CaughtCode([&]{ settler.Settle(ctx, pair, Bytes{0x10, 0xd1}); }) == ErrorCode::INVALID_CALLBACK);
  }
  SECTION("truncated arguments") {
    Bytes data = Callback(Amount(1), Amount(0), borrower);
    data.resize(4 + 64);
    REQUIRE(CaughtCode([&]{ settler.Settle(ctx, pair, data); }) == ErrorCode::MALFORMED_PAYLOAD);
  }
  SECTION("unregistered network") {
    LoanContext foreign{56, ctx.pool, usdc, borrower};
    REQUIRE(CaughtCode([&]{ settler.Settle(foreign, pair, Callback(Amount(1), Amount(0), borrower)); })
            == ErrorCode::UNSUPPORTED_NETWORK);
  }
}

TEST_CASE("Callback selector follows the network", "[settler]") {
  const std::string pancake = "pancakeCall(address,uint256,uint256,bytes)";
  NetworkRegistry networks;
  NetworkConfig bsc;
  bsc.chain_id = 56;
  bsc.wrapped_native = AddrWithLead(0xbb);
  bsc.reference_stable = AddrWithLead(0x55);
  bsc.factory = AddrWithLead(0xca);
  bsc.callback_signature = pancake;
  networks.Register(bsc);

  FakePairGateway gateway;
  Address pair = AddrWithLead(0x77);
  gateway.AddUnlistedPair(pair, bsc.reference_stable, bsc.wrapped_native);
  CallbackSettler settler(networks, gateway);
  Address borrower = AddrWithLead(0x99);
  LoanContext ctx{56, PoolHandle::FromExplicit(pair), bsc.wrapped_native, borrower};

  FlashSwapABI::CallbackPayload p{borrower, Amount(0), Amount(1000), Bytes{0x01}};
  auto transfers = settler.Settle(ctx, pair, FlashSwapABI::EncodeCallback(Crypto::SelectorOf(pancake), p));
  REQUIRE(transfers.size() == 1);
  REQUIRE(transfers[0].asset == bsc.wrapped_native);
  REQUIRE(transfers[0].amount == 1004);

  Bytes uniswap = FlashSwapABI::EncodeCallback(Crypto::SelectorOf(FlashSwapABI::CALLBACK_SIGNATURE), p);
  REQUIRE(CaughtCode([&]{ settler.Settle(ctx, pair, uniswap); }) == ErrorCode::INVALID_CALLBACK);
}
