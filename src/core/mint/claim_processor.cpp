#include "core/mint/claim_processor.hpp"

#include <algorithm>
#include <optional>
#include <utility>

#include "core/mint/artifact_assembler.hpp"
#include "core/storage/event_journal.hpp"
#include "core/util/hash.hpp"

namespace scanmint {
namespace {

void reserve_events(std::vector<EventEnvelope>& events, std::size_t extra) {
  if (events.capacity() - events.size() < extra) {
    events.reserve(std::max(events.size() + extra, events.capacity() * 2U));
  }
}

}  // namespace

Result check_claim(const MintState& state, const ChunkRegistry& registry, const ClaimRequest& request,
                   PendingClaim& out) {
  if (request.caller.empty()) {
    return Result::failure(MintError::NotAuthorized, "Claim requires a caller identity.");
  }

  std::uint64_t index = 0;
  if (const Result reserved = state.ledger.begin_claim(request.caller, index); !reserved.ok) {
    return reserved;
  }

  if (!registry.matches(index, request.payload)) {
    return Result::failure(MintError::HashMismatch, "Wrong data.");
  }

  out.index = index;
  return Result::success();
}

Result price_claim(const ExecutionMeter& meter, const ClaimRequest& request, PendingClaim& pending) {
  if (!meter) {
    return Result::failure(MintError::MeterUnavailable, "No execution meter is attached.");
  }
  const std::optional<std::uint64_t> spent = meter();
  if (!spent.has_value()) {
    return Result::failure(MintError::MeterUnavailable, "Execution meter returned no reading.");
  }

  pending.quote = FeeEngine::quote(pending.index, *spent, request.unit_price);
  if (const Result paid = FeeEngine::settle(pending.quote, request.attached_value, pending.settlement);
      !paid.ok) {
    return paid;
  }
  return ArtifactAssembler::phase(pending.index, pending.phase);
}

void stage_claim(MintState& state, const ClaimRequest& request, PendingClaim& pending) {
  const std::uint64_t first_sequence = state.events.size();
  pending.events.clear();
  pending.events.push_back(make_event(EventKind::Transfer, request.caller, first_sequence,
                                      {{"from", ""},
                                       {"to", request.caller},
                                       {"token_id", std::to_string(pending.index)}}));
  pending.events.push_back(make_event(EventKind::Claimed, request.caller, first_sequence + 1U,
                                      {{"caller", request.caller},
                                       {"index", std::to_string(pending.index)},
                                       {"required_total_cost", std::to_string(pending.quote.required_total_cost)},
                                       {"phase", std::string{pending.phase}},
                                       {"spent_units", std::to_string(pending.quote.spent_units)},
                                       {"unit_price", std::to_string(pending.quote.unit_price)},
                                       {"fee", std::to_string(pending.settlement.fee)},
                                       {"refund", std::to_string(pending.settlement.refund)},
                                       {"payload_hash", util::sha256_hex(request.payload)}}));

  pending.participant = request.caller;
  pending.owner = request.caller;

  ClaimReceipt& receipt = pending.receipt;
  receipt.index = pending.index;
  receipt.token_id = pending.index;
  receipt.required_total_cost = pending.quote.required_total_cost;
  receipt.spent_units = pending.quote.spent_units;
  receipt.fee = pending.settlement.fee;
  receipt.refund = pending.settlement.refund;
  receipt.phase = std::string{pending.phase};
  receipt.event_id = pending.events.back().event_id;

  // Capacity only; nothing a reader can observe.
  state.store.reserve_next(request.payload.size());
  reserve_events(state.events, pending.events.size());
}

Result pay_refund(const PaymentSink& payments, const ClaimRequest& request, const PendingClaim& pending) {
  if (pending.settlement.refund == 0) {
    return Result::success();
  }
  if (!payments || !payments(request.caller, pending.settlement.refund)) {
    return Result::failure(MintError::RefundFailed,
                           "Refund of " + std::to_string(pending.settlement.refund) + " to caller failed.");
  }
  return Result::success();
}

void commit_claim(MintState& state, const ClaimRequest& request, PendingClaim& pending, ClaimReceipt& out) {
  state.store.put(pending.index, request.payload);
  state.ledger.commit(std::move(pending.participant), pending.index);
  state.tokens.mint(std::move(pending.owner), pending.index);
  state.accumulated_balance += pending.settlement.fee;
  state.total_collected += pending.settlement.fee;
  for (EventEnvelope& event : pending.events) {
    state.events.push_back(std::move(event));
  }
  out = std::move(pending.receipt);
}

Result stage_withdraw(MintState& state, std::string_view owner, std::string_view caller, PendingWithdraw& out) {
  if (owner.empty() || caller != owner) {
    return Result::failure(MintError::NotAuthorized, "Caller is not the owner.");
  }

  out.amount = state.accumulated_balance;
  out.event = make_event(EventKind::Withdrawn, caller, state.events.size(),
                         {{"recipient", std::string{caller}},
                          {"amount", std::to_string(out.amount)}});
  out.receipt.recipient = std::string{caller};
  out.receipt.amount = out.amount;
  reserve_events(state.events, 1U);
  return Result::success();
}

Result pay_withdrawal(const PaymentSink& payments, const PendingWithdraw& pending) {
  if (pending.amount == 0) {
    return Result::success();
  }
  if (!payments || !payments(pending.receipt.recipient, pending.amount)) {
    return Result::failure(MintError::PayoutFailed,
                           "Payout of " + std::to_string(pending.amount) + " to the owner failed.");
  }
  return Result::success();
}

void commit_withdraw(MintState& state, PendingWithdraw& pending, WithdrawReceipt& out) {
  state.accumulated_balance -= pending.amount;
  state.total_withdrawn += pending.amount;
  state.events.push_back(std::move(pending.event));
  out = std::move(pending.receipt);
}

}  // namespace scanmint
