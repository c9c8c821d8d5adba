#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "core/model/types.hpp"

namespace scanmint {

// Ownership records for minted copies. Token ids equal claim indices and are
// minted in order.
class TokenRegistry {
public:
  TokenRegistry();

  // Throws std::logic_error unless token_id is the next id to mint. Does not
  // allocate while fewer than kChunkCount tokens exist.
  void mint(std::string to, std::uint64_t token_id);

  Result owner_of(std::uint64_t token_id, std::string& out) const;
  Result get_approved(std::uint64_t token_id, std::string& out) const;
  [[nodiscard]] std::uint64_t balance_of(std::string_view identity) const;
  [[nodiscard]] std::uint64_t total_supply() const { return owners_.size(); }
  [[nodiscard]] bool exists(std::uint64_t token_id) const { return token_id < owners_.size(); }
  [[nodiscard]] bool is_approved_for_all(std::string_view owner, std::string_view operator_id) const;

  Result approve(std::string_view caller, std::string_view spender, std::uint64_t token_id);
  Result set_approval_for_all(std::string_view caller, std::string_view operator_id, bool approved);
  Result transfer_from(std::string_view caller, std::string_view from, std::string_view to,
                       std::uint64_t token_id);

private:
  std::vector<std::string> owners_;
  std::unordered_map<std::uint64_t, std::string> token_approvals_;
  std::unordered_map<std::string, std::unordered_set<std::string>> operator_approvals_;

  Result require_token(std::uint64_t token_id) const;
};

}  // namespace scanmint
