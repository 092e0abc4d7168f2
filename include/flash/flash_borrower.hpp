#pragma once
#include <functional>
#include <optional>
#include <vector>
#include "uniswap_v2/callback_settler.hpp"
#include "uniswap_v2/loan_request_builder.hpp"

// Receiving end of the pair's flash-swap callback.
class FlashSwapCallee {
public:
  virtual ~FlashSwapCallee() = default;
  // sender is the caller of the callback; calldata is selector || arguments
  virtual void OnFlashSwap(const Address& sender, const Bytes& calldata) = 0;
};

// Executes pair.swap(). With non-empty call.data the pair releases the funds and
// calls callee.OnFlashSwap before Swap returns; a failed repayment check throws.
class SwapGateway {
public:
  virtual ~SwapGateway() = default;
  virtual void Swap(const BorrowCall& call, FlashSwapCallee& callee) = 0;
};

struct FlashLoanReceipt {
  BorrowCall call;
  std::vector<RepayTransfer> repayments;
};

// Runs one borrow -> callback -> repay cycle. Any failure propagates so the
// enclosing transaction is rolled back as a whole.
class FlashBorrower : public FlashSwapCallee {
public:
  // Runs while the borrowed funds are held, before repayment
  using LoanHandler = std::function<void(const LoanContext&, const FlashSwapABI::CallbackPayload&)>;

  FlashBorrower(const LoanRequestBuilder& builder,
                const CallbackSettler& settler,
                SwapGateway& swaps,
                TokenGateway& tokens)
    : builder_(builder), settler_(settler), swaps_(swaps), tokens_(tokens) {}

  void SetLoanHandler(LoanHandler handler) { handler_ = std::move(handler); }

  FlashLoanReceipt Borrow(unsigned long long chain_id,
                          const std::optional<PoolHandle>& explicit_pool,
                          const Address& asset,
                          const Amount& amount,
                          const Bytes& user_data = Bytes());

  // INVALID_CALLBACK when no loan is in flight or it was already settled;
  // TRANSFER_FAILED when a token transfer reports failure.
  void OnFlashSwap(const Address& sender, const Bytes& calldata) override;

  bool InFlight() const { return active_.has_value(); }
private:
  const LoanRequestBuilder& builder_;
  const CallbackSettler& settler_;
  SwapGateway& swaps_;
  TokenGateway& tokens_;
  LoanHandler handler_;
  std::optional<LoanContext> active_;
  std::optional<std::vector<RepayTransfer>> settled_;
};
