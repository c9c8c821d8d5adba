#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "core/mint/chunk_registry.hpp"
#include "core/mint/fee_engine.hpp"
#include "core/mint/mint_state.hpp"
#include "core/model/types.hpp"
#include "core/storage/event_journal.hpp"

namespace scanmint {

// Reads take the mutex briefly. Writes also hold the single writer slot, and
// release the mutex while the meter or payment sink runs, so a host callback
// may read the ledger. A write attempted from inside such a callback fails
// with ReentrantWrite.
class MinerService {
public:
  Result init(const MinerConfig& config, ExecutionMeter meter, PaymentSink payments);

  Result claim(const ClaimRequest& request, ClaimReceipt& out);
  Result withdraw(std::string_view caller, WithdrawReceipt& out);

  Result approve(std::string_view caller, std::string_view spender, std::uint64_t token_id);
  Result set_approval_for_all(std::string_view caller, std::string_view operator_id, bool approved);
  Result transfer_from(std::string_view caller, std::string_view from, std::string_view to,
                       std::uint64_t token_id);

  Result expected_hash(std::uint64_t index, Digest& out) const;
  Result phase(std::uint64_t index, std::string& out) const;
  Result assemble(std::uint64_t index, Artifact& out) const;
  Result quote(std::uint64_t index, std::uint64_t spent_units, std::uint64_t unit_price, FeeQuote& out) const;

  Result owner_of(std::uint64_t token_id, std::string& out) const;
  Result get_approved(std::uint64_t token_id, std::string& out) const;
  Result image_uri(std::uint64_t token_id, std::string& out) const;
  Result token_uri(std::uint64_t token_id, std::string& out) const;

  [[nodiscard]] bool has_claimed(std::string_view identity) const;
  [[nodiscard]] bool is_approved_for_all(std::string_view owner, std::string_view operator_id) const;
  [[nodiscard]] std::uint64_t balance_of(std::string_view identity) const;
  [[nodiscard]] std::uint64_t total_supply() const;
  [[nodiscard]] std::uint64_t next_index() const;
  [[nodiscard]] std::uint64_t chunk_count() const { return kChunkCount; }
  [[nodiscard]] std::uint64_t accumulated_balance() const;
  [[nodiscard]] LedgerStatus status() const;
  [[nodiscard]] std::vector<EventEnvelope> events() const;

private:
  class WriteScope;

  mutable std::mutex mutex_;
  std::condition_variable writer_idle_;
  bool writer_active_ = false;
  std::thread::id writer_thread_;

  bool initialized_ = false;
  MinerConfig config_;
  ChunkRegistry registry_;
  MintState state_;
  ExecutionMeter meter_;
  PaymentSink payments_;
  EventJournal journal_;
  std::size_t journaled_events_ = 0;
  std::string journal_error_;

  Result ensure_initialized() const;
  Result assemble_locked(std::uint64_t index, Artifact& out) const;
  std::string flush_journal();
};

}  // namespace scanmint
