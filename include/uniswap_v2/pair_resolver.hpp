#pragma once
#include <optional>
#include <utility>
#include "config/network.hpp"
#include "uniswap_v2/pool.hpp"

// Finds the pair a flash swap of `asset` borrows from.
class PairResolver {
public:
  PairResolver(const NetworkRegistry& networks, PairGateway& gateway)
    : networks_(networks), gateway_(gateway) {}

  // An explicit pool is returned as-is without consulting the factory. Otherwise
  // asset is paired with the network's wrapped native token (or with the reference
  // stable when asset is the wrapped native) and the factory is asked for the pair.
  // Throws FlashSwapError(UNSUPPORTED_NETWORK | POOL_NOT_FOUND).
  PoolHandle Resolve(unsigned long long chain_id,
                     const std::optional<PoolHandle>& explicit_pool,
                     const Address& asset);

  static Address CounterAsset(const NetworkConfig& cfg, const Address& asset);
  // Ascending address order, i.e. (token0, token1). Throws FlashSwapError(IDENTICAL_ASSETS).
  static std::pair<Address, Address> SortTokens(const Address& a, const Address& b);

  const NetworkRegistry& Networks() const { return networks_; }
private:
  const NetworkRegistry& networks_;
  PairGateway& gateway_;
};
