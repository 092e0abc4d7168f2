#pragma once
#include <vector>
#include "primitives/address.hpp"
#include "primitives/amount.hpp"
#include "uniswap_v2/pool.hpp"
#include "utils/hex.hpp"

// Parameters of the pair.swap() that releases the borrowed asset.
struct BorrowCall {
  unsigned long long chain_id = 0;
  PoolHandle pool;
  Address asset;
  PairSlot slot = PairSlot::SLOT0;
  Amount amount0_out;
  Amount amount1_out;
  Address recipient;
  Bytes data;

  const Amount& Borrowed() const { return slot == PairSlot::SLOT0 ? amount0_out : amount1_out; }
};

// What the callback needs to know about the loan it is settling. One per request.
struct LoanContext {
  unsigned long long chain_id = 0;
  PoolHandle pool;
  Address requested_asset;
  Address borrower;

  static LoanContext From(const BorrowCall& call) {
    return LoanContext{call.chain_id, call.pool, call.asset, call.recipient};
  }
};

struct RepayTransfer {
  Address asset;
  Address to;
  Amount amount;
};
