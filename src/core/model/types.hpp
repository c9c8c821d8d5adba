#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/model/app_meta.hpp"

namespace scanmint {

enum class MintError {
  None,
  InvalidConfiguration,
  IndexOutOfRange,
  AlreadyParticipated,
  MintingComplete,
  HashMismatch,
  InsufficientPayment,
  NotYetClaimed,
  NotAuthorized,
  NotOwnerNorApproved,
  RefundFailed,
  PayoutFailed,
  MeterUnavailable,
  ReentrantWrite,
};

std::string_view mint_error_name(MintError error);

struct Result {
  bool ok = false;
  MintError error = MintError::None;
  std::string message;
  std::string data;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, MintError::None, std::move(msg), std::move(payload)};
  }

  static Result failure(MintError error, std::string msg) {
    return {false, error, std::move(msg), {}};
  }
};

using Digest = std::array<unsigned char, kDigestBytes>;

// Units consumed so far by the running operation; empty when the host cannot report.
using ExecutionMeter = std::function<std::optional<std::uint64_t>()>;

// Sends value out of the ledger: claim refunds and owner withdrawals. Returns
// false when the transfer did not go through.
using PaymentSink = std::function<bool(std::string_view recipient, std::uint64_t amount)>;

enum class EventKind {
  Claimed,
  Transfer,
  Approval,
  ApprovalForAll,
  Withdrawn,
};

struct EventEnvelope {
  std::string event_id;
  EventKind kind = EventKind::Claimed;
  std::string actor;
  std::uint64_t sequence = 0;
  std::int64_t unix_ts = 0;
  std::string payload;
};

struct ClaimRequest {
  std::string caller;
  std::string payload;
  std::uint64_t attached_value = 0;
  std::uint64_t unit_price = 0;
};

struct ClaimReceipt {
  std::uint64_t index = 0;
  std::uint64_t token_id = 0;
  std::uint64_t required_total_cost = 0;
  std::uint64_t spent_units = 0;
  std::uint64_t fee = 0;
  std::uint64_t refund = 0;
  std::string phase;
  std::string event_id;
};

struct WithdrawReceipt {
  std::string recipient;
  std::uint64_t amount = 0;
};

struct Artifact {
  std::uint64_t index = 0;
  std::string bytes;
  std::uint64_t size_kb = 0;
  std::string phase;
};

struct LedgerStatus {
  bool initialized = false;
  std::uint64_t chunk_count = kChunkCount;
  std::uint64_t next_index = 0;
  bool minting_complete = false;
  std::uint64_t total_supply = 0;
  std::uint64_t accumulated_balance = 0;
  std::uint64_t total_collected = 0;
  std::uint64_t total_withdrawn = 0;
  std::size_t assembled_payload_bytes = 0;
  std::size_t event_count = 0;
  std::size_t journaled_events = 0;
  std::string owner;
  std::string journal_path;
  std::string journal_error;
};

struct MinerConfig {
  std::string header;
  std::string footer = std::string{kDefaultFooter};
  std::vector<Digest> expected_hashes;
  std::string owner;
  std::string collection_name = std::string{kDefaultCollectionName};
  std::string description = std::string{kDefaultDescription};
  std::string journal_path;
};

}  // namespace scanmint
