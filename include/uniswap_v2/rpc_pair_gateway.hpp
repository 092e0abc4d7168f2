#pragma once
#include <map>
#include <tuple>
#include "uniswap_v2/pool.hpp"
#include "utils/hex.hpp"

class RpcClient;

// PairGateway over eth_call. getPair results are cached per (factory, token0, token1).
class RpcPairGateway : public PairGateway {
public:
  explicit RpcPairGateway(RpcClient& rpc, int timeout_ms = 3000) : rpc_(rpc), timeout_ms_(timeout_ms) {}
  Address GetPair(const Address& factory, const Address& token_a, const Address& token_b) override;
  Address Token0(const Address& pair) override;
  Address Token1(const Address& pair) override;
private:
  // Single address return word. Throws FlashSwapError(MALFORMED_PAYLOAD) on bad return data.
  Address CallForAddress(const Address& to, const Bytes& calldata);
  RpcClient& rpc_;
  int timeout_ms_;
  std::map<std::tuple<Address, Address, Address>, Address> pair_cache_;
};
