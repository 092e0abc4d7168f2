#include "flash/flash_borrower.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace {
  // Clears the in-flight loan on every exit from Borrow
  struct LoanScope {
    std::optional<LoanContext>& active;
    std::optional<std::vector<RepayTransfer>>& settled;
    ~LoanScope() { active.reset(); settled.reset(); }
  };

  nlohmann::json TransfersToJson(const std::vector<RepayTransfer>& transfers) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& t : transfers) {
      arr.push_back(nlohmann::json{{"asset", t.asset.ToHex()}, {"to", t.to.ToHex()}, {"amount", AmountToString(t.amount)}});
    }
    return arr;
  }
}

FlashLoanReceipt FlashBorrower::Borrow(unsigned long long chain_id,
                                       const std::optional<PoolHandle>& explicit_pool,
                                       const Address& asset,
                                       const Amount& amount,
                                       const Bytes& user_data) {
  if (active_) throw std::logic_error("flash loan already in flight");
  BorrowCall call = builder_.BuildLoan(chain_id, explicit_pool, asset, amount, user_data);

  active_ = LoanContext::From(call);
  LoanScope scope{active_, settled_};
  StructuredLogger::Instance().LogEvent("loan_built", {
    {"chain_id", chain_id}, {"pair", call.pool.Pair().ToHex()}, {"asset", asset.ToHex()},
    {"amount0_out", AmountToString(call.amount0_out)}, {"amount1_out", AmountToString(call.amount1_out)}});

  try {
    swaps_.Swap(call, *this);
    if (!settled_) {
      throw FlashSwapError(ErrorCode::INVALID_CALLBACK, "pair " + call.pool.Pair().ToHex() + " did not call back");
    }
  } catch (const FlashSwapError& e) {
    Logger::Error(std::string("Flash loan failed: ") + e.what());
    StructuredLogger::Instance().LogEvent("loan_failed", {
      {"pair", call.pool.Pair().ToHex()}, {"error", ErrorCodeName(e.Code())}, {"detail", e.what()}});
    throw;
  } catch (const std::exception& e) {
    Logger::Error(std::string("Flash swap reverted: ") + e.what());
    StructuredLogger::Instance().LogEvent("loan_failed", {
      {"pair", call.pool.Pair().ToHex()}, {"error", "SwapReverted"}, {"detail", e.what()}});
    throw;
  }

  FlashLoanReceipt receipt{call, *settled_};
  StructuredLogger::Instance().LogEvent("loan_settled", {
    {"pair", call.pool.Pair().ToHex()}, {"repayments", TransfersToJson(receipt.repayments)}});
  return receipt;
}

void FlashBorrower::OnFlashSwap(const Address& sender, const Bytes& calldata) {
  if (!active_) throw FlashSwapError(ErrorCode::INVALID_CALLBACK, "no flash loan in flight");
  if (settled_) throw FlashSwapError(ErrorCode::INVALID_CALLBACK, "flash loan already settled");
  const LoanContext& ctx = *active_;

  auto payload = settler_.Verify(ctx, sender, calldata);
  if (handler_) handler_(ctx, payload);
  // computed in full before the first transfer so an overflow moves nothing
  auto transfers = settler_.RepayTransfers(ctx, payload);
  for (const auto& t : transfers) {
    if (!tokens_.Transfer(t.asset, t.to, t.amount)) {
      throw FlashSwapError(ErrorCode::TRANSFER_FAILED,
                           "transfer of " + AmountToString(t.amount) + " " + t.asset.ToHex() + " to " + t.to.ToHex());
    }
    Logger::Info("Repaid " + AmountToString(t.amount) + " of " + t.asset.ToHex() + " to " + t.to.ToHex());
  }
  settled_ = std::move(transfers);
}
