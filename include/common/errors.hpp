#pragma once
#include <stdexcept>
#include <string>

// Failure kinds of a flash-loan cycle. Every one of them is fatal for the
// enclosing transaction; none is retried.
enum class ErrorCode {
  UNSUPPORTED_NETWORK,
  POOL_NOT_FOUND,
  INVALID_CALLBACK,
  MALFORMED_PAYLOAD,
  ARITHMETIC_OVERFLOW,
  POOL_MISMATCH,
  ASSET_NOT_IN_POOL,
  IDENTICAL_ASSETS,
  INVALID_AMOUNT,
  TRANSFER_FAILED
};

const char* ErrorCodeName(ErrorCode code);

class FlashSwapError : public std::runtime_error {
public:
  FlashSwapError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(ErrorCodeName(code)) + ": " + detail), code_(code) {}
  ErrorCode Code() const { return code_; }
private:
  ErrorCode code_;
};
