#pragma once
#include <cstdint>
#include <string>
#include "crypto/keccak.hpp"
#include "primitives/address.hpp"
#include "primitives/amount.hpp"
#include "utils/hex.hpp"

// Calldata layouts of the V2 pair, factory and ERC-20 calls a flash swap touches.
namespace FlashSwapABI {
  inline const std::string CALLBACK_SIGNATURE = "uniswapV2Call(address,uint256,uint256,bytes)";
  inline const std::string SWAP_SIGNATURE = "swap(uint256,uint256,address,bytes)";
  inline const std::string GET_PAIR_SIGNATURE = "getPair(address,address)";
  inline const std::string TOKEN0_SIGNATURE = "token0()";
  inline const std::string TOKEN1_SIGNATURE = "token1()";
  inline const std::string TRANSFER_SIGNATURE = "transfer(address,uint256)";

  const Crypto::Selector& SwapSelector();
  const Crypto::Selector& GetPairSelector();
  const Crypto::Selector& TransferSelector();

  // Arguments of the pair -> borrower callback
  struct CallbackPayload {
    Address initiator;
    Amount amount0;
    Amount amount1;
    Bytes extra_params;
  };

  // selector || (address initiator, uint256 amount0, uint256 amount1, bytes extra_params)
  Bytes EncodeCallback(const Crypto::Selector& selector, const CallbackPayload& payload);
  // Decodes the argument block (selector already stripped). The block must be
  // exactly head + tail long. Throws FlashSwapError(MALFORMED_PAYLOAD).
  CallbackPayload DecodeCallbackArgs(const std::uint8_t* data, size_t len);

  Bytes EncodeSwap(const Amount& amount0_out, const Amount& amount1_out, const Address& to, const Bytes& data);
  Bytes EncodeGetPair(const Address& token_a, const Address& token_b);
  Bytes EncodeTransfer(const Address& to, const Amount& amount);
  // Calldata for an argument-less call such as token0()
  Bytes EncodeCall(const std::string& signature);
}
