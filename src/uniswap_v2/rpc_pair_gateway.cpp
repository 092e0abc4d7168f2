#include "uniswap_v2/rpc_pair_gateway.hpp"
#include "uniswap_v2/flash_swap_abi.hpp"
#include "node_connection/rpc_client.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "encoding/abi.hpp"
#include <algorithm>
#include <stdexcept>

Address RpcPairGateway::CallForAddress(const Address& to, const Bytes& calldata) {
  auto res = rpc_.EthCall(to.ToHex(), BytesToHex0x(calldata), std::nullopt, timeout_ms_);
  Bytes ret;
  try {
    ret = HexToBytes(res);
  } catch (const std::invalid_argument& e) {
    throw FlashSwapError(ErrorCode::MALFORMED_PAYLOAD, std::string("eth_call return data: ") + e.what());
  }
  // calls to an address without code return empty data
  if (ret.empty()) throw FlashSwapError(ErrorCode::MALFORMED_PAYLOAD, "no return data from " + to.ToHex());
  return Abi::Reader(ret).AddressAt(0);
}

Address RpcPairGateway::GetPair(const Address& factory, const Address& token_a, const Address& token_b) {
  auto key = std::make_tuple(factory, std::min(token_a, token_b), std::max(token_a, token_b));
  auto it = pair_cache_.find(key);
  if (it != pair_cache_.end()) return it->second;
  Address pair = CallForAddress(factory, FlashSwapABI::EncodeGetPair(token_a, token_b));
  // a missing pair may be created later, only remember real ones
  if (!pair.IsZero()) pair_cache_.emplace(key, pair);
  return pair;
}

Address RpcPairGateway::Token0(const Address& pair) {
  return CallForAddress(pair, FlashSwapABI::EncodeCall(FlashSwapABI::TOKEN0_SIGNATURE));
}

Address RpcPairGateway::Token1(const Address& pair) {
  return CallForAddress(pair, FlashSwapABI::EncodeCall(FlashSwapABI::TOKEN1_SIGNATURE));
}
