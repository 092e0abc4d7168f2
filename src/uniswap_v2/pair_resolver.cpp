#include "uniswap_v2/pair_resolver.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

Address PairResolver::CounterAsset(const NetworkConfig& cfg, const Address& asset) {
  return asset == cfg.wrapped_native ? cfg.reference_stable : cfg.wrapped_native;
}

std::pair<Address, Address> PairResolver::SortTokens(const Address& a, const Address& b) {
  if (a == b) throw FlashSwapError(ErrorCode::IDENTICAL_ASSETS, a.ToHex());
  return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

PoolHandle PairResolver::Resolve(unsigned long long chain_id,
                                 const std::optional<PoolHandle>& explicit_pool,
                                 const Address& asset) {
  if (explicit_pool) return *explicit_pool;

  const NetworkConfig& cfg = networks_.Get(chain_id);
  auto [token0, token1] = SortTokens(CounterAsset(cfg, asset), asset);
  Address pair = gateway_.GetPair(cfg.factory, token0, token1);
  if (pair.IsZero()) {
    throw FlashSwapError(ErrorCode::POOL_NOT_FOUND,
                         "factory " + cfg.factory.ToHex() + " has no pair for " + token0.ToHex() + "/" + token1.ToHex());
  }
  Logger::Debug("Resolved pair " + pair.ToHex() + " for " + token0.ToHex() + "/" + token1.ToHex());
  return PoolHandle(pair);
}
