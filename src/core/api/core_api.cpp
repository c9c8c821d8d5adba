#include "core/api/core_api.hpp"

#include <utility>

#include "core/config/manifest.hpp"

namespace scanmint {

Result CoreApi::init(const MinerConfig& config, ExecutionMeter meter, PaymentSink payments) {
  return service_.init(config, std::move(meter), std::move(payments));
}

Result CoreApi::init_from_manifest(std::string_view manifest_path, ExecutionMeter meter, PaymentSink payments) {
  MinerConfig config;
  if (const Result loaded = load_manifest(manifest_path, config); !loaded.ok) {
    return loaded;
  }
  return service_.init(config, std::move(meter), std::move(payments));
}

Result CoreApi::claim(const ClaimRequest& request, ClaimReceipt& out) {
  return service_.claim(request, out);
}

Result CoreApi::withdraw(std::string_view caller, WithdrawReceipt& out) {
  return service_.withdraw(caller, out);
}

Result CoreApi::approve(std::string_view caller, std::string_view spender, std::uint64_t token_id) {
  return service_.approve(caller, spender, token_id);
}

Result CoreApi::set_approval_for_all(std::string_view caller, std::string_view operator_id, bool approved) {
  return service_.set_approval_for_all(caller, operator_id, approved);
}

Result CoreApi::transfer_from(std::string_view caller, std::string_view from, std::string_view to,
                              std::uint64_t token_id) {
  return service_.transfer_from(caller, from, to, token_id);
}

Result CoreApi::expected_hash(std::uint64_t index, Digest& out) const {
  return service_.expected_hash(index, out);
}

Result CoreApi::phase(std::uint64_t index, std::string& out) const {
  return service_.phase(index, out);
}

Result CoreApi::assemble(std::uint64_t index, Artifact& out) const {
  return service_.assemble(index, out);
}

Result CoreApi::quote(std::uint64_t index, std::uint64_t spent_units, std::uint64_t unit_price,
                      FeeQuote& out) const {
  return service_.quote(index, spent_units, unit_price, out);
}

Result CoreApi::owner_of(std::uint64_t token_id, std::string& out) const {
  return service_.owner_of(token_id, out);
}

Result CoreApi::get_approved(std::uint64_t token_id, std::string& out) const {
  return service_.get_approved(token_id, out);
}

Result CoreApi::image_uri(std::uint64_t token_id, std::string& out) const {
  return service_.image_uri(token_id, out);
}

Result CoreApi::token_uri(std::uint64_t token_id, std::string& out) const {
  return service_.token_uri(token_id, out);
}

bool CoreApi::has_claimed(std::string_view identity) const {
  return service_.has_claimed(identity);
}

bool CoreApi::is_approved_for_all(std::string_view owner, std::string_view operator_id) const {
  return service_.is_approved_for_all(owner, operator_id);
}

std::uint64_t CoreApi::balance_of(std::string_view identity) const {
  return service_.balance_of(identity);
}

std::uint64_t CoreApi::total_supply() const {
  return service_.total_supply();
}

std::uint64_t CoreApi::next_index() const {
  return service_.next_index();
}

std::uint64_t CoreApi::chunk_count() const {
  return service_.chunk_count();
}

std::uint64_t CoreApi::accumulated_balance() const {
  return service_.accumulated_balance();
}

LedgerStatus CoreApi::status() const {
  return service_.status();
}

std::vector<EventEnvelope> CoreApi::events() const {
  return service_.events();
}

}  // namespace scanmint
