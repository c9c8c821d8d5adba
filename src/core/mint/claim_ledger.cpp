#include "core/mint/claim_ledger.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace scanmint {

ClaimLedger::ClaimLedger(std::uint64_t capacity) : capacity_(capacity) {
  participants_.reserve(static_cast<std::size_t>(capacity));
}

Result ClaimLedger::begin_claim(std::string_view identity, std::uint64_t& out_index) const {
  if (has_claimed(identity)) {
    return Result::failure(MintError::AlreadyParticipated, "Cannot mine more than once.");
  }
  if (complete()) {
    return Result::failure(MintError::MintingComplete, "Mining is over.");
  }

  out_index = next_index_;
  return Result::success();
}

void ClaimLedger::commit(std::string identity, std::uint64_t index) {
  if (index != next_index_ || complete()) {
    throw std::logic_error("Claim ledger commit for index " + std::to_string(index) +
                           " does not match cursor " + std::to_string(next_index_) + ".");
  }
  const auto slot = std::ranges::lower_bound(participants_, identity);
  if (slot != participants_.end() && *slot == identity) {
    throw std::logic_error("Claim ledger commit for an identity that already claimed.");
  }
  participants_.insert(slot, std::move(identity));
  ++next_index_;
}

bool ClaimLedger::has_claimed(std::string_view identity) const {
  const auto slot = std::ranges::lower_bound(participants_, identity, {}, [](const std::string& participant) {
    return std::string_view{participant};
  });
  return slot != participants_.end() && *slot == identity;
}

}  // namespace scanmint
