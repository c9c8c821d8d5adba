#pragma once

#include <cstdint>
#include <vector>

#include "core/mint/claim_ledger.hpp"
#include "core/mint/token_registry.hpp"
#include "core/model/types.hpp"
#include "core/storage/chunk_store.hpp"

namespace scanmint {

// All mutable mint state. MinerService writes it only while holding its lock.
struct MintState {
  ClaimLedger ledger;
  ChunkStore store;
  TokenRegistry tokens;
  std::uint64_t accumulated_balance = 0;
  std::uint64_t total_collected = 0;
  std::uint64_t total_withdrawn = 0;
  std::vector<EventEnvelope> events;
};

}  // namespace scanmint
