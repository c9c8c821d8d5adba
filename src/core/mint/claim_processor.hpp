#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/mint/chunk_registry.hpp"
#include "core/mint/fee_engine.hpp"
#include "core/mint/mint_state.hpp"
#include "core/model/types.hpp"

namespace scanmint {

// A claim that passed its checks. Staging fills in everything the commit
// needs, so committing moves prepared values into reserved capacity.
struct PendingClaim {
  std::uint64_t index = 0;
  FeeQuote quote;
  Settlement settlement;
  std::string_view phase;
  std::string participant;
  std::string owner;
  std::vector<EventEnvelope> events;
  ClaimReceipt receipt;
};

struct PendingWithdraw {
  std::uint64_t amount = 0;
  EventEnvelope event;
  WithdrawReceipt receipt;
};

// A claim runs check -> price -> stage -> refund -> commit. Check, stage and
// commit need exclusive access to state, and no other write may land between
// stage and commit. Price and refund call into the host and touch no state.
// Every step before commit leaves state observably unchanged.
Result check_claim(const MintState& state, const ChunkRegistry& registry, const ClaimRequest& request,
                   PendingClaim& out);
Result price_claim(const ExecutionMeter& meter, const ClaimRequest& request, PendingClaim& pending);
void stage_claim(MintState& state, const ClaimRequest& request, PendingClaim& pending);
Result pay_refund(const PaymentSink& payments, const ClaimRequest& request, const PendingClaim& pending);
void commit_claim(MintState& state, const ClaimRequest& request, PendingClaim& pending, ClaimReceipt& out);

// Withdraw runs stage -> payout -> commit under the same rules.
Result stage_withdraw(MintState& state, std::string_view owner, std::string_view caller, PendingWithdraw& out);
Result pay_withdrawal(const PaymentSink& payments, const PendingWithdraw& pending);
void commit_withdraw(MintState& state, PendingWithdraw& pending, WithdrawReceipt& out);

}  // namespace scanmint
