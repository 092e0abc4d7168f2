#include "uniswap_v2/flash_swap_abi.hpp"
#include "common/errors.hpp"
#include "encoding/abi.hpp"

namespace {
  // Head of (address|uint256, uint256, address|uint256, bytes) is four words
  constexpr size_t kFourWordHead = 4 * Abi::kWordSize;
}

namespace FlashSwapABI {
  const Crypto::Selector& SwapSelector() {
    static const Crypto::Selector sel = Crypto::SelectorOf(SWAP_SIGNATURE);
    return sel;
  }

  const Crypto::Selector& GetPairSelector() {
    static const Crypto::Selector sel = Crypto::SelectorOf(GET_PAIR_SIGNATURE);
    return sel;
  }

  const Crypto::Selector& TransferSelector() {
    static const Crypto::Selector sel = Crypto::SelectorOf(TRANSFER_SIGNATURE);
    return sel;
  }

  Bytes EncodeCallback(const Crypto::Selector& selector, const CallbackPayload& payload) {
    Bytes out;
    Abi::AppendSelector(out, selector);
    Abi::AppendAddress(out, payload.initiator);
    Abi::AppendUint256(out, payload.amount0);
    Abi::AppendUint256(out, payload.amount1);
    Abi::AppendUint256(out, Amount(kFourWordHead));
    Abi::AppendBytesTail(out, payload.extra_params);
    return out;
  }

  CallbackPayload DecodeCallbackArgs(const std::uint8_t* data, size_t len) {
    Abi::Reader reader(data, len);
    CallbackPayload p;
    p.initiator = reader.AddressAt(0);
    p.amount0 = reader.Uint256At(Abi::kWordSize);
    p.amount1 = reader.Uint256At(2 * Abi::kWordSize);
    size_t end = 0;
    p.extra_params = reader.BytesAt(3 * Abi::kWordSize, kFourWordHead, end);
    if (end != len) {
      throw FlashSwapError(ErrorCode::MALFORMED_PAYLOAD,
                           std::to_string(len - end) + " trailing bytes after callback arguments");
    }
    return p;
  }

  Bytes EncodeSwap(const Amount& amount0_out, const Amount& amount1_out, const Address& to, const Bytes& data) {
    Bytes out;
    Abi::AppendSelector(out, SwapSelector());
    Abi::AppendUint256(out, amount0_out);
    Abi::AppendUint256(out, amount1_out);
    Abi::AppendAddress(out, to);
    Abi::AppendUint256(out, Amount(kFourWordHead));
    Abi::AppendBytesTail(out, data);
    return out;
  }

  Bytes EncodeGetPair(const Address& token_a, const Address& token_b) {
    Bytes out;
    Abi::AppendSelector(out, GetPairSelector());
    Abi::AppendAddress(out, token_a);
    Abi::AppendAddress(out, token_b);
    return out;
  }

  Bytes EncodeTransfer(const Address& to, const Amount& amount) {
    Bytes out;
    Abi::AppendSelector(out, TransferSelector());
    Abi::AppendAddress(out, to);
    Abi::AppendUint256(out, amount);
    return out;
  }

  Bytes EncodeCall(const std::string& signature) {
    Bytes out;
    Abi::AppendSelector(out, Crypto::SelectorOf(signature));
    return out;
  }
}
