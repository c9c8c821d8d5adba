#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace scanmint {

class ClaimLedger {
public:
  ClaimLedger() : ClaimLedger(kChunkCount) {}
  explicit ClaimLedger(std::uint64_t capacity);

  // Reserves the next index for identity without changing the ledger.
  Result begin_claim(std::string_view identity, std::uint64_t& out_index) const;

  // Finalizes a reservation. Throws std::logic_error if the reservation went
  // stale; otherwise never allocates.
  void commit(std::string identity, std::uint64_t index);

  [[nodiscard]] bool has_claimed(std::string_view identity) const;
  [[nodiscard]] std::uint64_t next_index() const { return next_index_; }
  [[nodiscard]] bool complete() const { return next_index_ >= capacity_; }

private:
  std::uint64_t capacity_ = kChunkCount;
  std::uint64_t next_index_ = 0;
  // Sorted; capacity reserved up front.
  std::vector<std::string> participants_;
};

}  // namespace scanmint
