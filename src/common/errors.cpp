#include "common/errors.hpp"

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::UNSUPPORTED_NETWORK: return "UnsupportedNetwork";
    case ErrorCode::POOL_NOT_FOUND: return "PoolNotFound";
    case ErrorCode::INVALID_CALLBACK: return "InvalidCallback";
    case ErrorCode::MALFORMED_PAYLOAD: return "MalformedPayload";
    case ErrorCode::ARITHMETIC_OVERFLOW: return "ArithmeticOverflow";
    case ErrorCode::POOL_MISMATCH: return "PoolMismatch";
    case ErrorCode::ASSET_NOT_IN_POOL: return "AssetNotInPool";
    case ErrorCode::IDENTICAL_ASSETS: return "IdenticalAssets";
    case ErrorCode::INVALID_AMOUNT: return "InvalidAmount";
    case ErrorCode::TRANSFER_FAILED: return "TransferFailed";
  }
  return "Unknown";
}
