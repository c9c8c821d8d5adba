#include "core/mint/token_registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace scanmint {

TokenRegistry::TokenRegistry() {
  owners_.reserve(static_cast<std::size_t>(kChunkCount));
}

void TokenRegistry::mint(std::string to, std::uint64_t token_id) {
  if (to.empty()) {
    throw std::logic_error("Token mint requires a recipient.");
  }
  if (token_id != owners_.size()) {
    throw std::logic_error("Token " + std::to_string(token_id) + " minted out of order.");
  }
  owners_.push_back(std::move(to));
}

Result TokenRegistry::require_token(std::uint64_t token_id) const {
  if (!exists(token_id)) {
    return Result::failure(MintError::NotYetClaimed,
                           "Token " + std::to_string(token_id) + " has not been minted.");
  }
  return Result::success();
}

Result TokenRegistry::owner_of(std::uint64_t token_id, std::string& out) const {
  if (const Result found = require_token(token_id); !found.ok) {
    return found;
  }
  out = owners_[static_cast<std::size_t>(token_id)];
  return Result::success();
}

Result TokenRegistry::get_approved(std::uint64_t token_id, std::string& out) const {
  if (const Result found = require_token(token_id); !found.ok) {
    return found;
  }
  const auto it = token_approvals_.find(token_id);
  out = it == token_approvals_.end() ? std::string{} : it->second;
  return Result::success();
}

std::uint64_t TokenRegistry::balance_of(std::string_view identity) const {
  return static_cast<std::uint64_t>(std::ranges::count(owners_, identity));
}

bool TokenRegistry::is_approved_for_all(std::string_view owner, std::string_view operator_id) const {
  const auto it = operator_approvals_.find(std::string{owner});
  if (it == operator_approvals_.end()) {
    return false;
  }
  return it->second.contains(std::string{operator_id});
}

Result TokenRegistry::approve(std::string_view caller, std::string_view spender, std::uint64_t token_id) {
  if (const Result found = require_token(token_id); !found.ok) {
    return found;
  }

  const std::string& owner = owners_[static_cast<std::size_t>(token_id)];
  if (spender == owner) {
    return Result::failure(MintError::NotOwnerNorApproved, "Approval to current owner.");
  }
  if (caller != owner && !is_approved_for_all(owner, caller)) {
    return Result::failure(MintError::NotOwnerNorApproved,
                           "Approve caller is not owner nor approved for all.");
  }

  if (spender.empty()) {
    token_approvals_.erase(token_id);
  } else {
    token_approvals_[token_id] = std::string{spender};
  }
  return Result::success("Approval updated.", owner);
}

Result TokenRegistry::set_approval_for_all(std::string_view caller, std::string_view operator_id,
                                           bool approved) {
  if (caller.empty() || operator_id.empty()) {
    return Result::failure(MintError::NotAuthorized, "Operator approval requires both identities.");
  }
  if (caller == operator_id) {
    return Result::failure(MintError::NotOwnerNorApproved, "Cannot approve self as operator.");
  }

  auto& operators = operator_approvals_[std::string{caller}];
  if (approved) {
    operators.emplace(operator_id);
  } else {
    operators.erase(std::string{operator_id});
  }
  return Result::success("Operator approval updated.");
}

Result TokenRegistry::transfer_from(std::string_view caller, std::string_view from, std::string_view to,
                                    std::uint64_t token_id) {
  if (const Result found = require_token(token_id); !found.ok) {
    return found;
  }

  std::string& owner = owners_[static_cast<std::size_t>(token_id)];
  const auto approval = token_approvals_.find(token_id);
  const bool approved_spender = approval != token_approvals_.end() && approval->second == caller;
  if (caller != owner && !approved_spender && !is_approved_for_all(owner, caller)) {
    return Result::failure(MintError::NotOwnerNorApproved, "Transfer caller is not owner nor approved.");
  }
  if (from != owner) {
    return Result::failure(MintError::NotOwnerNorApproved, "Transfer from incorrect owner.");
  }
  if (to.empty()) {
    return Result::failure(MintError::NotAuthorized, "Transfer to the empty identity.");
  }

  token_approvals_.erase(token_id);
  owner = std::string{to};
  return Result::success("Token transferred.");
}

}  // namespace scanmint
