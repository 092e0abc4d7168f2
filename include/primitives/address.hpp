#pragma once
#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>

// 20-byte account identifier. Comparison is byte-wise big-endian, which is the
// numeric address order a V2 factory uses to pick token0 / token1.
class Address {
public:
  static constexpr size_t kSize = 20;
  using Raw = std::array<std::uint8_t, kSize>;

  Address() : bytes_{} {}
  explicit Address(const Raw& bytes) : bytes_(bytes) {}

  // Accepts 40 hex digits with optional 0x prefix, any case. Throws std::invalid_argument.
  static Address FromHex(const std::string& hex);

  bool IsZero() const;
  const Raw& Data() const { return bytes_; }
  std::string ToHex() const;
  // EIP-55 mixed-case encoding
  std::string ToChecksumHex() const;

  bool operator==(const Address& o) const { return bytes_ == o.bytes_; }
  bool operator!=(const Address& o) const { return bytes_ != o.bytes_; }
  bool operator<(const Address& o) const { return bytes_ < o.bytes_; }
private:
  Raw bytes_;
};

struct AddressHash {
  size_t operator()(const Address& a) const {
    // addresses are hash outputs already, the first word is well distributed
    size_t h = 0;
    std::memcpy(&h, a.Data().data(), sizeof(h));
    return h;
  }
};
