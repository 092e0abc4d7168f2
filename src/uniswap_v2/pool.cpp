#include "uniswap_v2/pool.hpp"
#include "common/errors.hpp"

PoolHandle PoolHandle::FromExplicit(const Address& pair) {
  if (pair.IsZero()) throw FlashSwapError(ErrorCode::POOL_NOT_FOUND, "explicit pool is the zero address");
  return PoolHandle(pair);
}
