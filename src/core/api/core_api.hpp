#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/mint/fee_engine.hpp"
#include "core/model/types.hpp"
#include "core/service/miner_service.hpp"

namespace scanmint {

class CoreApi {
public:
  Result init(const MinerConfig& config, ExecutionMeter meter, PaymentSink payments);
  Result init_from_manifest(std::string_view manifest_path, ExecutionMeter meter, PaymentSink payments);

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

  bool has_claimed(std::string_view identity) const;
  bool is_approved_for_all(std::string_view owner, std::string_view operator_id) const;
  std::uint64_t balance_of(std::string_view identity) const;
  std::uint64_t total_supply() const;
  std::uint64_t next_index() const;
  std::uint64_t chunk_count() const;
  std::uint64_t accumulated_balance() const;
  LedgerStatus status() const;
  std::vector<EventEnvelope> events() const;

private:
  MinerService service_;
};

}  // namespace scanmint
