#include "primitives/amount.hpp"
#include "common/errors.hpp"
#include <cctype>
#include <stdexcept>

Amount ParseAmount(const std::string& text) {
  bool hex = text.rfind("0x", 0) == 0 || text.rfind("0X", 0) == 0;
  size_t start = hex ? 2 : 0;
  if (text.size() <= start) throw std::invalid_argument("empty amount");
  for (size_t i = start; i < text.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    if (hex ? !std::isxdigit(c) : !std::isdigit(c)) throw std::invalid_argument("invalid amount: " + text);
  }
  const std::string digits = hex ? "0x" + text.substr(2) : text;
  boost::multiprecision::cpp_int wide(digits.c_str());
  if (wide > boost::multiprecision::cpp_int(MaxAmount())) throw std::invalid_argument("amount exceeds uint256: " + text);
  return static_cast<Amount>(wide);
}

std::string AmountToString(const Amount& amount) {
  return amount.str();
}

Amount CheckedAdd(const Amount& a, const Amount& b) {
  Amount sum = a + b;
  if (sum < a) throw FlashSwapError(ErrorCode::ARITHMETIC_OVERFLOW, AmountToString(a) + " + " + AmountToString(b));
  return sum;
}
