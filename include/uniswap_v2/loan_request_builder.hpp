#pragma once
#include <optional>
#include "uniswap_v2/loan_types.hpp"
#include "uniswap_v2/pair_resolver.hpp"

// Turns "borrow `amount` of `asset`" into the pair.swap() parameters that make
// the pair release exactly that asset to the borrower and call it back.
class LoanRequestBuilder {
public:
  LoanRequestBuilder(PairResolver& resolver, PairGateway& gateway, const Address& borrower)
    : resolver_(resolver), gateway_(gateway), borrower_(borrower) {}

  // Throws FlashSwapError: INVALID_AMOUNT for a zero amount, ASSET_NOT_IN_POOL when
  // the pool does not hold asset, plus whatever PairResolver::Resolve throws.
  // call.data is user_data, or DefaultCallbackMarker() when user_data is empty:
  // a pair given empty data performs a plain swap and never calls back.
  BorrowCall BuildLoan(unsigned long long chain_id,
                       const std::optional<PoolHandle>& explicit_pool,
                       const Address& asset,
                       const Amount& amount,
                       const Bytes& user_data = Bytes()) const;

  // swap(uint256,uint256,address,bytes) calldata for the call
  static Bytes EncodeSwapCall(const BorrowCall& call);
  static const Bytes& DefaultCallbackMarker();

  const Address& Borrower() const { return borrower_; }
private:
  PairResolver& resolver_;
  PairGateway& gateway_;
  Address borrower_;
};
