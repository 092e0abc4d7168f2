#include "encoding/abi.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <iterator>

namespace Abi {
  void AppendSelector(Bytes& out, const Crypto::Selector& selector) {
    out.insert(out.end(), selector.begin(), selector.end());
  }

  void AppendUint256(Bytes& out, const Amount& value) {
    Bytes tmp;
    boost::multiprecision::export_bits(value, std::back_inserter(tmp), 8);
    // export_bits emits the minimal big-endian form; left-pad to a full word
    out.insert(out.end(), kWordSize - tmp.size(), 0);
    out.insert(out.end(), tmp.begin(), tmp.end());
  }

  void AppendAddress(Bytes& out, const Address& addr) {
    out.insert(out.end(), kWordSize - Address::kSize, 0);
    out.insert(out.end(), addr.Data().begin(), addr.Data().end());
  }

  void AppendBytesTail(Bytes& out, const Bytes& data) {
    AppendUint256(out, Amount(data.size()));
    out.insert(out.end(), data.begin(), data.end());
    out.insert(out.end(), PaddedSize(data.size()) - data.size(), 0);
  }

  const std::uint8_t* Reader::Word(size_t offset) const {
    if (offset > len_ || len_ - offset < kWordSize) {
      throw FlashSwapError(ErrorCode::MALFORMED_PAYLOAD,
                           "word at " + std::to_string(offset) + " past end of " + std::to_string(len_) + " bytes");
    }
    return data_ + offset;
  }

  Amount Reader::Uint256At(size_t offset) const {
    const std::uint8_t* w = Word(offset);
    Amount v;
    boost::multiprecision::import_bits(v, w, w + kWordSize);
    return v;
  }

  Address Reader::AddressAt(size_t offset) const {
    const std::uint8_t* w = Word(offset);
    const size_t pad = kWordSize - Address::kSize;
    if (std::any_of(w, w + pad, [](std::uint8_t b){ return b != 0; })) {
      throw FlashSwapError(ErrorCode::MALFORMED_PAYLOAD, "dirty address word at " + std::to_string(offset));
    }
    Address::Raw raw{};
    std::copy(w + pad, w + kWordSize, raw.begin());
    return Address(raw);
  }

  size_t Reader::SizeAt(size_t offset) const {
    Amount v = Uint256At(offset);
    if (v > Amount(len_)) {
      throw FlashSwapError(ErrorCode::MALFORMED_PAYLOAD, "size word at " + std::to_string(offset) + " out of range");
    }
    return static_cast<size_t>(v.convert_to<unsigned long long>());
  }

  Bytes Reader::BytesAt(size_t head_offset, size_t head_size, size_t& tail_end) const {
    size_t start = SizeAt(head_offset);
    if (start % kWordSize != 0 || start < head_size) {
      throw FlashSwapError(ErrorCode::MALFORMED_PAYLOAD, "bad bytes offset " + std::to_string(start));
    }
    size_t len = SizeAt(start);
    size_t body = start + kWordSize;
    if (len_ - body < PaddedSize(len)) {
      throw FlashSwapError(ErrorCode::MALFORMED_PAYLOAD, "bytes length " + std::to_string(len) + " past end");
    }
    tail_end = body + PaddedSize(len);
    return Bytes(data_ + body, data_ + body + len);
  }
}
