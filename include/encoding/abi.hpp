#pragma once
#include <cstdint>
#include <string>
#include "crypto/keccak.hpp"
#include "primitives/address.hpp"
#include "primitives/amount.hpp"
#include "utils/hex.hpp"

// Solidity ABI head/tail word encoding for the static types and dynamic
// `bytes` used by pair calls and callbacks.
namespace Abi {
  constexpr size_t kWordSize = 32;

  void AppendSelector(Bytes& out, const Crypto::Selector& selector);
  void AppendUint256(Bytes& out, const Amount& value);
  void AppendAddress(Bytes& out, const Address& addr);
  // length word followed by data right-padded to a word boundary
  void AppendBytesTail(Bytes& out, const Bytes& data);
  inline size_t PaddedSize(size_t len) { return (len + kWordSize - 1) / kWordSize * kWordSize; }

  // Bounds-checked view over encoded arguments (selector already stripped).
  // Every accessor throws FlashSwapError(MALFORMED_PAYLOAD) on shape errors.
  class Reader {
  public:
    Reader(const std::uint8_t* data, size_t len) : data_(data), len_(len) {}
    explicit Reader(const Bytes& data) : data_(data.data()), len_(data.size()) {}
    size_t Size() const { return len_; }
    Amount Uint256At(size_t offset) const;
    // Upper 12 bytes of the word must be zero
    Address AddressAt(size_t offset) const;
    // Follows the offset stored in the head word at head_offset. The offset must be
    // word aligned and point at or after head_size. tail_end receives the padded end.
    Bytes BytesAt(size_t head_offset, size_t head_size, size_t& tail_end) const;
  private:
    const std::uint8_t* Word(size_t offset) const;
    size_t SizeAt(size_t offset) const;
    const std::uint8_t* data_;
    size_t len_;
  };
}
