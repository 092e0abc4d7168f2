#pragma once
#include "primitives/address.hpp"
#include "primitives/amount.hpp"

// The two asset positions of a V2 pair; token0 has the lower address.
enum class PairSlot { SLOT0, SLOT1 };

class PairResolver;

// Capability for a V2 pair. Obtained from PairResolver or through the
// validated explicit constructor, never from an unchecked address.
class PoolHandle {
public:
  // Throws FlashSwapError(POOL_NOT_FOUND) for the zero address
  static PoolHandle FromExplicit(const Address& pair);
  const Address& Pair() const { return pair_; }
  bool operator==(const PoolHandle& o) const { return pair_ == o.pair_; }
  bool operator!=(const PoolHandle& o) const { return pair_ != o.pair_; }
private:
  friend class PairResolver;
  explicit PoolHandle(const Address& pair) : pair_(pair) {}
  Address pair_;
};

// Read side of the factory and pair contracts.
class PairGateway {
public:
  virtual ~PairGateway() = default;
  // Zero address when the factory has no pair for the two tokens
  virtual Address GetPair(const Address& factory, const Address& token_a, const Address& token_b) = 0;
  virtual Address Token0(const Address& pair) = 0;
  virtual Address Token1(const Address& pair) = 0;
};

// ERC-20 transfer from the borrower's balance. Returns the token's success flag.
class TokenGateway {
public:
  virtual ~TokenGateway() = default;
  virtual bool Transfer(const Address& token, const Address& to, const Amount& amount) = 0;
};
