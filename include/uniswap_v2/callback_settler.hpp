#pragma once
#include <vector>
#include "config/network.hpp"
#include "uniswap_v2/flash_swap_abi.hpp"
#include "uniswap_v2/loan_types.hpp"

// Handles the pair's callback: authenticates it against the loan in flight and
// computes what has to be paid back. Never moves funds itself.
class CallbackSettler {
public:
  CallbackSettler(const NetworkRegistry& networks, PairGateway& gateway)
    : networks_(networks), gateway_(gateway) {}

  // Checks the selector (INVALID_CALLBACK), decodes the arguments (MALFORMED_PAYLOAD),
  // then requires sender == ctx.pool (POOL_MISMATCH) and initiator == ctx.borrower
  // (INVALID_CALLBACK).
  FlashSwapABI::CallbackPayload Verify(const LoanContext& ctx, const Address& sender, const Bytes& calldata) const;

  // One transfer per non-zero slot, slot1 first, each for amount + fee back to
  // the pair. Throws FlashSwapError(ARITHMETIC_OVERFLOW) before returning anything.
  std::vector<RepayTransfer> RepayTransfers(const LoanContext& ctx, const FlashSwapABI::CallbackPayload& payload) const;

  // Verify + RepayTransfers
  std::vector<RepayTransfer> Settle(const LoanContext& ctx, const Address& sender, const Bytes& calldata) const;
private:
  const NetworkRegistry& networks_;
  PairGateway& gateway_;
};
