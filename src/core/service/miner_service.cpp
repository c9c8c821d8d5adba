#include "core/service/miner_service.hpp"

#include <mutex>
#include <sstream>
#include <utility>

#include "core/mint/artifact_assembler.hpp"
#include "core/mint/claim_processor.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace scanmint {
namespace {

Result with_journal_note(Result result, const std::string& journal_error) {
  if (!journal_error.empty()) {
    result.message += " Journal write failed: " + journal_error;
  }
  return result;
}

}  // namespace

class MinerService::WriteScope {
public:
  WriteScope(MinerService& service, std::unique_lock<std::mutex>& lock) : service_(service), lock_(lock) {}
  WriteScope(const WriteScope&) = delete;
  WriteScope& operator=(const WriteScope&) = delete;

  ~WriteScope() {
    if (!acquired_) {
      return;
    }
    if (!lock_.owns_lock()) {
      lock_.lock();
    }
    service_.writer_active_ = false;
    service_.writer_idle_.notify_all();
  }

  // Waits for another thread's write to finish; fails for the thread already writing.
  Result acquire() {
    if (service_.writer_active_ && service_.writer_thread_ == std::this_thread::get_id()) {
      return Result::failure(MintError::ReentrantWrite,
                             "Ledger write attempted from inside a meter or payment callback.");
    }
    service_.writer_idle_.wait(lock_, [this] { return !service_.writer_active_; });
    service_.writer_active_ = true;
    service_.writer_thread_ = std::this_thread::get_id();
    acquired_ = true;
    return Result::success();
  }

private:
  MinerService& service_;
  std::unique_lock<std::mutex>& lock_;
  bool acquired_ = false;
};

Result MinerService::init(const MinerConfig& config, ExecutionMeter meter, PaymentSink payments) {
  std::lock_guard lock(mutex_);
  if (initialized_) {
    return Result::failure(MintError::InvalidConfiguration, "Miner is already initialized.");
  }
  if (!util::ensure_crypto_ready()) {
    return Result::failure(MintError::InvalidConfiguration, "libsodium initialization failed.");
  }
  if (!meter) {
    return Result::failure(MintError::InvalidConfiguration, "Init failed: an execution meter is required.");
  }
  if (!payments) {
    return Result::failure(MintError::InvalidConfiguration, "Init failed: a payment sink is required.");
  }
  const std::string owner = util::trim_copy(config.owner);
  if (owner.empty()) {
    return Result::failure(MintError::InvalidConfiguration, "Init failed: owner identity is required.");
  }

  ChunkRegistry registry;
  if (const Result sealed = ChunkRegistry::create(config.expected_hashes, config.header, config.footer, registry);
      !sealed.ok) {
    return sealed;
  }

  EventJournal journal;
  if (!config.journal_path.empty()) {
    if (const Result opened = journal.open(config.journal_path); !opened.ok) {
      return opened;
    }
  }

  config_ = config;
  config_.owner = owner;
  registry_ = std::move(registry);
  state_ = MintState{};
  meter_ = std::move(meter);
  payments_ = std::move(payments);
  journal_ = std::move(journal);
  journaled_events_ = 0;
  journal_error_.clear();
  initialized_ = true;
  return Result::success("Miner initialized with " + std::to_string(registry_.size()) + " scans.");
}

Result MinerService::ensure_initialized() const {
  if (!initialized_) {
    return Result::failure(MintError::InvalidConfiguration, "Miner is not initialized.");
  }
  return Result::success();
}

// Appends every event not yet on disk. A failed append stays pending and is
// retried after the next write.
std::string MinerService::flush_journal() {
  while (journaled_events_ < state_.events.size()) {
    if (const Result appended = journal_.append(state_.events[journaled_events_]); !appended.ok) {
      journal_error_ = appended.message;
      return journal_error_;
    }
    ++journaled_events_;
  }
  journal_error_.clear();
  return {};
}

Result MinerService::claim(const ClaimRequest& request, ClaimReceipt& out) {
  std::unique_lock lock(mutex_);
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return ready;
  }
  WriteScope scope{*this, lock};
  if (const Result slot = scope.acquire(); !slot.ok) {
    return slot;
  }

  PendingClaim pending;
  if (const Result checked = check_claim(state_, registry_, request, pending); !checked.ok) {
    return checked;
  }

  lock.unlock();
  if (const Result priced = price_claim(meter_, request, pending); !priced.ok) {
    return priced;
  }

  lock.lock();
  stage_claim(state_, request, pending);
  lock.unlock();
  if (const Result refunded = pay_refund(payments_, request, pending); !refunded.ok) {
    return refunded;
  }

  lock.lock();
  commit_claim(state_, request, pending, out);
  return with_journal_note(
      Result::success("Claimed scan " + std::to_string(out.index) + " (" + out.phase + ")."), flush_journal());
}

Result MinerService::withdraw(std::string_view caller, WithdrawReceipt& out) {
  std::unique_lock lock(mutex_);
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return ready;
  }
  WriteScope scope{*this, lock};
  if (const Result slot = scope.acquire(); !slot.ok) {
    return slot;
  }

  PendingWithdraw pending;
  if (const Result staged = stage_withdraw(state_, config_.owner, caller, pending); !staged.ok) {
    return staged;
  }

  lock.unlock();
  if (const Result paid = pay_withdrawal(payments_, pending); !paid.ok) {
    return paid;
  }

  lock.lock();
  commit_withdraw(state_, pending, out);
  return with_journal_note(Result::success("Withdrew " + std::to_string(out.amount) + "."), flush_journal());
}

Result MinerService::approve(std::string_view caller, std::string_view spender, std::uint64_t token_id) {
  std::unique_lock lock(mutex_);
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return ready;
  }
  WriteScope scope{*this, lock};
  if (const Result slot = scope.acquire(); !slot.ok) {
    return slot;
  }

  const Result approved = state_.tokens.approve(caller, spender, token_id);
  if (!approved.ok) {
    return approved;
  }

  state_.events.push_back(make_event(EventKind::Approval, caller, state_.events.size(),
                                     {{"owner", approved.data},
                                      {"approved", std::string{spender}},
                                      {"token_id", std::to_string(token_id)}}));
  return with_journal_note(approved, flush_journal());
}

Result MinerService::set_approval_for_all(std::string_view caller, std::string_view operator_id, bool approved) {
  std::unique_lock lock(mutex_);
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return ready;
  }
  WriteScope scope{*this, lock};
  if (const Result slot = scope.acquire(); !slot.ok) {
    return slot;
  }

  const Result updated = state_.tokens.set_approval_for_all(caller, operator_id, approved);
  if (!updated.ok) {
    return updated;
  }

  state_.events.push_back(make_event(EventKind::ApprovalForAll, caller, state_.events.size(),
                                     {{"owner", std::string{caller}},
                                      {"operator", std::string{operator_id}},
                                      {"approved", approved ? "1" : "0"}}));
  return with_journal_note(updated, flush_journal());
}

Result MinerService::transfer_from(std::string_view caller, std::string_view from, std::string_view to,
                                   std::uint64_t token_id) {
  std::unique_lock lock(mutex_);
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return ready;
  }
  WriteScope scope{*this, lock};
  if (const Result slot = scope.acquire(); !slot.ok) {
    return slot;
  }

  const Result transferred = state_.tokens.transfer_from(caller, from, to, token_id);
  if (!transferred.ok) {
    return transferred;
  }

  state_.events.push_back(make_event(EventKind::Transfer, caller, state_.events.size(),
                                     {{"from", std::string{from}},
                                      {"to", std::string{to}},
                                      {"token_id", std::to_string(token_id)}}));
  return with_journal_note(transferred, flush_journal());
}

Result MinerService::expected_hash(std::uint64_t index, Digest& out) const {
  std::lock_guard lock(mutex_);
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return ready;
  }
  return registry_.expected_hash(index, out);
}

Result MinerService::phase(std::uint64_t index, std::string& out) const {
  std::string_view label;
  if (const Result phased = ArtifactAssembler::phase(index, label); !phased.ok) {
    return phased;
  }
  out = std::string{label};
  return Result::success();
}

Result MinerService::assemble_locked(std::uint64_t index, Artifact& out) const {
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return ready;
  }
  const ArtifactAssembler assembler{registry_, state_.store};
  return assembler.assemble(index, out);
}

Result MinerService::assemble(std::uint64_t index, Artifact& out) const {
  std::lock_guard lock(mutex_);
  return assemble_locked(index, out);
}

Result MinerService::quote(std::uint64_t index, std::uint64_t spent_units, std::uint64_t unit_price,
                           FeeQuote& out) const {
  if (index >= kChunkCount) {
    return Result::failure(MintError::IndexOutOfRange,
                           "Scan index " + std::to_string(index) + " is out of range.");
  }
  out = FeeEngine::quote(index, spent_units, unit_price);
  return Result::success();
}

Result MinerService::owner_of(std::uint64_t token_id, std::string& out) const {
  std::lock_guard lock(mutex_);
  return state_.tokens.owner_of(token_id, out);
}

Result MinerService::get_approved(std::uint64_t token_id, std::string& out) const {
  std::lock_guard lock(mutex_);
  return state_.tokens.get_approved(token_id, out);
}

Result MinerService::image_uri(std::uint64_t token_id, std::string& out) const {
  std::lock_guard lock(mutex_);
  Artifact artifact;
  if (const Result assembled = assemble_locked(token_id, artifact); !assembled.ok) {
    return assembled;
  }
  out = std::string{kImageDataUriPrefix} + artifact.bytes;
  return Result::success();
}

Result MinerService::token_uri(std::uint64_t token_id, std::string& out) const {
  std::lock_guard lock(mutex_);
  Artifact artifact;
  if (const Result assembled = assemble_locked(token_id, artifact); !assembled.ok) {
    return assembled;
  }

  std::ostringstream json;
  json << "{\"name\":\"" << util::json_escape(config_.collection_name) << ": " << (token_id + 1U) << " of "
       << kChunkCount << " copies\","
       << "\"description\":\"" << util::json_escape(config_.description) << "\","
       << "\"image\":\"" << kImageDataUriPrefix << util::json_escape(artifact.bytes) << "\","
       << "\"attributes\":[{\"trait_type\":\"kilobytes\",\"value\":" << artifact.size_kb << "},"
       << "{\"trait_type\":\"phase\",\"value\":\"" << util::json_escape(artifact.phase) << "\"}]}";
  out = json.str();
  return Result::success();
}

bool MinerService::has_claimed(std::string_view identity) const {
  std::lock_guard lock(mutex_);
  return state_.ledger.has_claimed(identity);
}

bool MinerService::is_approved_for_all(std::string_view owner, std::string_view operator_id) const {
  std::lock_guard lock(mutex_);
  return state_.tokens.is_approved_for_all(owner, operator_id);
}

std::uint64_t MinerService::balance_of(std::string_view identity) const {
  std::lock_guard lock(mutex_);
  return state_.tokens.balance_of(identity);
}

std::uint64_t MinerService::total_supply() const {
  std::lock_guard lock(mutex_);
  return state_.tokens.total_supply();
}

std::uint64_t MinerService::next_index() const {
  std::lock_guard lock(mutex_);
  return state_.ledger.next_index();
}

std::uint64_t MinerService::accumulated_balance() const {
  std::lock_guard lock(mutex_);
  return state_.accumulated_balance;
}

LedgerStatus MinerService::status() const {
  std::lock_guard lock(mutex_);
  LedgerStatus status;
  status.initialized = initialized_;
  status.next_index = state_.ledger.next_index();
  status.minting_complete = state_.ledger.complete();
  status.total_supply = state_.tokens.total_supply();
  status.accumulated_balance = state_.accumulated_balance;
  status.total_collected = state_.total_collected;
  status.total_withdrawn = state_.total_withdrawn;
  status.assembled_payload_bytes = state_.store.total_bytes();
  status.event_count = state_.events.size();
  status.owner = config_.owner;
  status.journal_path = journal_.path();
  status.journaled_events = journaled_events_;
  status.journal_error = journal_error_;
  return status;
}

std::vector<EventEnvelope> MinerService::events() const {
  std::lock_guard lock(mutex_);
  return state_.events;
}

}  // namespace scanmint
