#include "uniswap_v2/loan_request_builder.hpp"
#include "uniswap_v2/flash_swap_abi.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

const Bytes& LoanRequestBuilder::DefaultCallbackMarker() {
  static const Bytes marker{0x01};
  return marker;
}

BorrowCall LoanRequestBuilder::BuildLoan(unsigned long long chain_id,
                                         const std::optional<PoolHandle>& explicit_pool,
                                         const Address& asset,
                                         const Amount& amount,
                                         const Bytes& user_data) const {
  if (amount == 0) throw FlashSwapError(ErrorCode::INVALID_AMOUNT, "cannot borrow zero " + asset.ToHex());

  PoolHandle pool = resolver_.Resolve(chain_id, explicit_pool, asset);
  Address token0 = gateway_.Token0(pool.Pair());
  PairSlot slot = PairSlot::SLOT0;
  if (token0 != asset) {
    Address token1 = gateway_.Token1(pool.Pair());
    if (token1 != asset) {
      throw FlashSwapError(ErrorCode::ASSET_NOT_IN_POOL,
                           asset.ToHex() + " is neither token of pair " + pool.Pair().ToHex());
    }
    slot = PairSlot::SLOT1;
  }

  BorrowCall call{chain_id, pool, asset, slot,
                  slot == PairSlot::SLOT0 ? amount : Amount(0),
                  slot == PairSlot::SLOT1 ? amount : Amount(0),
                  borrower_,
                  user_data.empty() ? DefaultCallbackMarker() : user_data};
  Logger::Info("Built flash swap: pair=" + pool.Pair().ToHex() +
               " out0=" + AmountToString(call.amount0_out) +
               " out1=" + AmountToString(call.amount1_out) +
               " to=" + borrower_.ToHex());
  return call;
}

Bytes LoanRequestBuilder::EncodeSwapCall(const BorrowCall& call) {
  return FlashSwapABI::EncodeSwap(call.amount0_out, call.amount1_out, call.recipient, call.data);
}
