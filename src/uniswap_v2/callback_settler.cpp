#include "uniswap_v2/callback_settler.hpp"
#include "uniswap_v2/fee_calculator.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>

FlashSwapABI::CallbackPayload CallbackSettler::Verify(const LoanContext& ctx,
                                                      const Address& sender,
                                                      const Bytes& calldata) const {
  const NetworkConfig& cfg = networks_.Get(ctx.chain_id);
  const Crypto::Selector expected = Crypto::SelectorOf(cfg.callback_signature);
  if (calldata.size() < expected.size() || !std::equal(expected.begin(), expected.end(), calldata.begin())) {
    throw FlashSwapError(ErrorCode::INVALID_CALLBACK, "selector does not match " + cfg.callback_signature);
  }
  auto payload = FlashSwapABI::DecodeCallbackArgs(calldata.data() + expected.size(), calldata.size() - expected.size());
  if (sender != ctx.pool.Pair()) {
    throw FlashSwapError(ErrorCode::POOL_MISMATCH,
                         "callback from " + sender.ToHex() + ", loan pair is " + ctx.pool.Pair().ToHex());
  }
  if (payload.initiator != ctx.borrower) {
    throw FlashSwapError(ErrorCode::INVALID_CALLBACK, "swap initiated by " + payload.initiator.ToHex());
  }
  return payload;
}

std::vector<RepayTransfer> CallbackSettler::RepayTransfers(const LoanContext& ctx,
                                                           const FlashSwapABI::CallbackPayload& payload) const {
  std::vector<RepayTransfer> out;
  const Address& pair = ctx.pool.Pair();
  if (payload.amount1 != 0) {
    out.push_back({gateway_.Token1(pair), pair, FeeCalculator::RepayAmount(payload.amount1)});
  }
  if (payload.amount0 != 0) {
    out.push_back({gateway_.Token0(pair), pair, FeeCalculator::RepayAmount(payload.amount0)});
  }
  if (out.empty()) Logger::Warning("Callback from " + pair.ToHex() + " borrowed nothing");
  return out;
}

std::vector<RepayTransfer> CallbackSettler::Settle(const LoanContext& ctx,
                                                   const Address& sender,
                                                   const Bytes& calldata) const {
  return RepayTransfers(ctx, Verify(ctx, sender, calldata));
}
