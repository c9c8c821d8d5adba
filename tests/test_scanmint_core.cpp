#include <cassert>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/config/manifest.hpp"
#include "core/mint/artifact_assembler.hpp"
#include "core/mint/chunk_registry.hpp"
#include "core/mint/claim_ledger.hpp"
#include "core/mint/claim_processor.hpp"
#include "core/mint/fee_engine.hpp"
#include "core/mint/mint_state.hpp"
#include "core/mint/token_registry.hpp"
#include "core/storage/chunk_store.hpp"
#include "core/storage/event_journal.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace {

constexpr std::uint64_t kSpentUnits = 1000000;
constexpr std::string_view kOwner = "owner-cid";
constexpr std::string_view kHeader = "/9j/4AAQSkZJRgABAQ";

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "scanmint-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

std::string make_scan(std::uint64_t index) {
  return "scan-" + std::to_string(index) + ":" +
         std::string(200U + 37U * static_cast<std::size_t>(index), static_cast<char>('A' + index % 26U));
}

std::vector<std::string> make_scans() {
  std::vector<std::string> scans;
  for (std::uint64_t i = 0; i < scanmint::kChunkCount; ++i) {
    scans.push_back(make_scan(i));
  }
  return scans;
}

scanmint::MinerConfig make_config(const std::vector<std::string>& scans) {
  scanmint::MinerConfig config;
  config.header = std::string{kHeader};
  config.owner = std::string{kOwner};
  config.expected_hashes = scanmint::hash_scans(scans);
  return config;
}

scanmint::ExecutionMeter fixed_meter(std::uint64_t units) {
  return [units]() -> std::optional<std::uint64_t> { return units; };
}

scanmint::PaymentSink accept_payments() {
  return [](std::string_view, std::uint64_t) { return true; };
}

std::string participant(std::uint64_t index) {
  return "cid-participant-" + std::to_string(index);
}

scanmint::ClaimRequest paid_claim(std::string caller, std::string payload, std::uint64_t index) {
  return {
      .caller = std::move(caller),
      .payload = std::move(payload),
      .attached_value = scanmint::FeeEngine::required_total_cost(index),
      .unit_price = 1,
  };
}

void test_hash_and_canonical_helpers() {
  assert(scanmint::util::ensure_crypto_ready());
  assert(scanmint::util::sha256_hex("abc") ==
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  const scanmint::Digest digest = scanmint::util::sha256_digest("abc");
  scanmint::Digest parsed{};
  assert(scanmint::util::digest_from_hex(scanmint::util::digest_to_hex(digest), parsed));
  assert(parsed == digest);
  assert(scanmint::util::digest_from_hex("0x" + scanmint::util::digest_to_hex(digest), parsed));
  assert(!scanmint::util::digest_from_hex("abcd", parsed));
  assert(!scanmint::util::digest_from_hex(std::string(64, 'z'), parsed));

  const std::string payload = scanmint::util::canonical_join({{"b", "two\nlines"}, {"a", "back\\slash"}});
  assert(payload == "a=back\\\\slash\nb=two\\nlines\n");
  const auto fields = scanmint::util::parse_canonical_map(payload);
  assert(fields.at("a") == "back\\slash");
  assert(fields.at("b") == "two\nlines");

  const auto loose = scanmint::util::parse_canonical_map("uri=a=b\nno separator\n=orphan\nuri=later\ntail=end");
  assert(loose.size() == 2);
  assert(loose.at("uri") == "a=b");
  assert(loose.at("tail") == "end");

  assert(scanmint::util::trim_copy(" \t owner-cid \r\n") == "owner-cid");
  assert(scanmint::util::trim_copy(" \n ").empty());

  assert(scanmint::util::json_escape("say \"hi\"\n") == "say \\\"hi\\\"\\n");
}

void test_chunk_registry_requires_exact_hash_count() {
  const auto scans = make_scans();
  auto hashes = scanmint::hash_scans(scans);

  scanmint::ChunkRegistry registry;
  auto short_list = hashes;
  short_list.pop_back();
  scanmint::Result created = scanmint::ChunkRegistry::create(short_list, std::string{kHeader}, "", registry);
  assert(!created.ok);
  assert(created.error == scanmint::MintError::InvalidConfiguration);

  auto long_list = hashes;
  long_list.push_back(long_list.front());
  created = scanmint::ChunkRegistry::create(long_list, std::string{kHeader}, "", registry);
  assert(created.error == scanmint::MintError::InvalidConfiguration);

  // The header frames every assembled image, so it cannot be empty; the footer may be.
  created = scanmint::ChunkRegistry::create(hashes, "", "/9k=", registry);
  assert(created.error == scanmint::MintError::InvalidConfiguration);

  created = scanmint::ChunkRegistry::create(hashes, std::string{kHeader}, "/9k=", registry);
  assert(created.ok);
  assert(registry.size() == scanmint::kChunkCount);
  assert(registry.header() == kHeader);
  assert(registry.footer() == "/9k=");

  scanmint::Digest expected{};
  assert(registry.expected_hash(42, expected).ok);
  assert(expected == scanmint::util::sha256_digest(scans[42]));
  const scanmint::Result out_of_range = registry.expected_hash(100, expected);
  assert(out_of_range.error == scanmint::MintError::IndexOutOfRange);

  assert(registry.matches(7, scans[7]));
  assert(!registry.matches(7, scans[8]));
  assert(!registry.matches(100, scans[7]));
}

void test_chunk_store_is_append_only() {
  scanmint::ChunkStore store;
  std::string payload;
  assert(store.get(0, payload).error == scanmint::MintError::NotYetClaimed);

  store.put(0, "alpha");
  store.put(1, "beta");
  assert(store.size() == 2);
  assert(store.get(1, payload).ok);
  assert(payload == "beta");
  assert(store.prefix(0) == "alpha");
  assert(store.prefix(1) == "alphabeta");
  assert(store.prefix(2).empty());
  assert(store.get(2, payload).error == scanmint::MintError::NotYetClaimed);

  bool rejected_rewrite = false;
  try {
    store.put(1, "gamma");
  } catch (const std::logic_error&) {
    rejected_rewrite = true;
  }
  assert(rejected_rewrite);

  bool rejected_skip = false;
  try {
    store.put(3, "delta");
  } catch (const std::logic_error&) {
    rejected_skip = true;
  }
  assert(rejected_skip);
  assert(store.prefix(1) == "alphabeta");
  assert(store.total_bytes() == 9);
}

void test_claim_ledger_ordering_and_uniqueness() {
  scanmint::ClaimLedger ledger{2};
  std::uint64_t index = 99;

  assert(ledger.begin_claim("a", index).ok);
  assert(index == 0);
  // Reservation alone changes nothing.
  assert(ledger.next_index() == 0);
  assert(!ledger.has_claimed("a"));
  ledger.commit("a", index);
  assert(ledger.has_claimed("a"));
  assert(ledger.next_index() == 1);

  assert(ledger.begin_claim("a", index).error == scanmint::MintError::AlreadyParticipated);

  bool stale_rejected = false;
  try {
    ledger.commit("b", 0);
  } catch (const std::logic_error&) {
    stale_rejected = true;
  }
  assert(stale_rejected);

  assert(ledger.begin_claim("b", index).ok);
  assert(index == 1);
  ledger.commit("b", index);
  assert(ledger.complete());
  assert(ledger.begin_claim("c", index).error == scanmint::MintError::MintingComplete);
  assert(ledger.begin_claim("a", index).error == scanmint::MintError::AlreadyParticipated);
}

void test_fee_schedule() {
  assert(scanmint::FeeEngine::required_total_cost(0) == 3000000);
  assert(scanmint::FeeEngine::required_total_cost(99) == 9999993);
  for (std::uint64_t i = 0; i < scanmint::kChunkCount; i += 7) {
    for (std::uint64_t j = i + 1; j < scanmint::kChunkCount; j += 13) {
      const std::uint64_t lo = scanmint::FeeEngine::required_total_cost(i);
      const std::uint64_t hi = scanmint::FeeEngine::required_total_cost(j);
      assert(lo < hi);
      assert(hi - lo == 70707 * (j - i));
    }
  }

  scanmint::FeeQuote quote = scanmint::FeeEngine::quote(0, kSpentUnits, 2);
  assert(quote.billable_units == 3000000 - kSpentUnits - 260000);
  assert(quote.required_fee == 2 * (3000000 - kSpentUnits - 260000));

  scanmint::Settlement settlement;
  assert(scanmint::FeeEngine::settle(quote, quote.required_fee - 1, settlement).error ==
         scanmint::MintError::InsufficientPayment);
  assert(scanmint::FeeEngine::settle(quote, quote.required_fee + 500, settlement).ok);
  assert(settlement.fee == quote.required_fee);
  assert(settlement.refund == 500);

  // Execution above the schedule floors the fee at zero.
  quote = scanmint::FeeEngine::quote(5, 5000000, 1000);
  assert(quote.billable_units == 0);
  assert(quote.required_fee == 0);
  assert(scanmint::FeeEngine::settle(quote, 0, settlement).ok);
  assert(settlement.fee == 0);

  quote = scanmint::FeeEngine::quote(5, std::numeric_limits<std::uint64_t>::max(), 1);
  assert(quote.required_fee == 0);

  quote = scanmint::FeeEngine::quote(99, 0, std::numeric_limits<std::uint64_t>::max());
  assert(quote.fee_overflow);
  assert(scanmint::FeeEngine::settle(quote, std::numeric_limits<std::uint64_t>::max(), settlement).error ==
         scanmint::MintError::InsufficientPayment);
}

void test_phase_boundaries() {
  std::string_view label;
  assert(scanmint::ArtifactAssembler::phase(0, label).ok && label == "Black & White");
  assert(scanmint::ArtifactAssembler::phase(10, label).ok && label == "Black & White");
  assert(scanmint::ArtifactAssembler::phase(11, label).ok && label == "Color");
  assert(scanmint::ArtifactAssembler::phase(32, label).ok && label == "Color");
  assert(scanmint::ArtifactAssembler::phase(33, label).ok && label == "Resolution");
  assert(scanmint::ArtifactAssembler::phase(99, label).ok && label == "Resolution");
  assert(scanmint::ArtifactAssembler::phase(100, label).error == scanmint::MintError::IndexOutOfRange);

  // No init needed: phase and quote depend on the index alone.
  scanmint::CoreApi api;
  std::string phase;
  assert(api.phase(11, phase).ok);
  assert(phase == "Color");
  scanmint::FeeQuote quote;
  assert(api.quote(99, 0, 1, quote).ok);
  assert(quote.required_fee == 9999993 - 260000);
  assert(api.quote(100, 0, 1, quote).error == scanmint::MintError::IndexOutOfRange);
}

void test_claims_consume_next_index() {
  const auto scans = make_scans();
  scanmint::CoreApi api;
  assert(api.init(make_config(scans), fixed_meter(kSpentUnits), accept_payments()).ok);
  assert(api.next_index() == 0);
  assert(api.chunk_count() == 100);

  // A caller cannot pick its index; scan 5 is only valid at cursor 5.
  scanmint::ClaimReceipt receipt;
  scanmint::Result claimed = api.claim(paid_claim(participant(0), scans[5], 5), receipt);
  assert(claimed.error == scanmint::MintError::HashMismatch);
  assert(claimed.message == "Wrong data.");

  for (std::uint64_t i = 0; i < 3; ++i) {
    claimed = api.claim(paid_claim(participant(i), scans[i], i), receipt);
    assert(claimed.ok);
    assert(receipt.index == i);
    assert(receipt.token_id == i);
    assert(receipt.required_total_cost == scanmint::FeeEngine::required_total_cost(i));
    assert(receipt.phase == "Black & White");
    assert(api.next_index() == i + 1);
    assert(api.has_claimed(participant(i)));

    std::string owner;
    assert(api.owner_of(i, owner).ok);
    assert(owner == participant(i));
  }

  claimed = api.claim(paid_claim(participant(1), scans[3], 3), receipt);
  assert(claimed.error == scanmint::MintError::AlreadyParticipated);
  assert(api.next_index() == 3);
}

void test_rejected_claims_leave_state_untouched() {
  const auto scans = make_scans();
  std::vector<std::string> refunded;
  bool refund_ok = true;

  scanmint::CoreApi api;
  assert(api.init(make_config(scans), fixed_meter(kSpentUnits),
                  [&refunded, &refund_ok](std::string_view recipient, std::uint64_t amount) {
                    (void)amount;
                    refunded.emplace_back(recipient);
                    return refund_ok;
                  })
             .ok);

  const auto assert_pristine = [&api]() {
    const auto status = api.status();
    assert(status.next_index == 0);
    assert(status.total_supply == 0);
    assert(status.accumulated_balance == 0);
    assert(status.assembled_payload_bytes == 0);
    assert(status.event_count == 0);
    assert(!api.has_claimed("cid-x"));
    scanmint::Artifact artifact;
    assert(api.assemble(0, artifact).error == scanmint::MintError::NotYetClaimed);
  };

  scanmint::ClaimReceipt receipt;
  assert(api.claim(paid_claim("cid-x", scans[1], 0), receipt).error == scanmint::MintError::HashMismatch);
  assert_pristine();

  scanmint::ClaimRequest underpaid = paid_claim("cid-x", scans[0], 0);
  underpaid.attached_value = 3000000 - kSpentUnits - 260000 - 1;
  assert(api.claim(underpaid, receipt).error == scanmint::MintError::InsufficientPayment);
  underpaid.attached_value = 0;
  assert(api.claim(underpaid, receipt).error == scanmint::MintError::InsufficientPayment);
  assert_pristine();

  scanmint::ClaimRequest anonymous = paid_claim("", scans[0], 0);
  assert(api.claim(anonymous, receipt).error == scanmint::MintError::NotAuthorized);
  assert_pristine();

  refund_ok = false;
  assert(api.claim(paid_claim("cid-x", scans[0], 0), receipt).error == scanmint::MintError::RefundFailed);
  assert(refunded.size() == 1);
  assert_pristine();

  // An exact payment needs no refund, so a broken refund path does not matter.
  scanmint::ClaimRequest exact = paid_claim("cid-x", scans[0], 0);
  exact.attached_value = 3000000 - kSpentUnits - 260000;
  assert(api.claim(exact, receipt).ok);
  assert(receipt.refund == 0);
  assert(refunded.size() == 1);
  assert(api.accumulated_balance() == exact.attached_value);
}

void test_settlement_refunds_overpayment() {
  const auto scans = make_scans();
  std::unordered_map<std::string, std::uint64_t> refunds;

  scanmint::CoreApi api;
  assert(api.init(make_config(scans), fixed_meter(kSpentUnits),
                  [&refunds](std::string_view recipient, std::uint64_t amount) {
                    refunds[std::string{recipient}] += amount;
                    return true;
                  })
             .ok);

  scanmint::ClaimRequest request = paid_claim(participant(0), scans[0], 0);
  request.unit_price = 3;
  request.attached_value = 20000000;
  scanmint::ClaimReceipt receipt;
  assert(api.claim(request, receipt).ok);

  const std::uint64_t expected_fee = 3 * (3000000 - kSpentUnits - 260000);
  assert(receipt.fee == expected_fee);
  assert(receipt.refund == 20000000 - expected_fee);
  assert(refunds.at(participant(0)) == receipt.refund);
  assert(api.accumulated_balance() == expected_fee);
  assert(api.status().total_collected == expected_fee);
}

void test_meter_is_required() {
  const auto scans = make_scans();

  scanmint::CoreApi no_meter;
  assert(no_meter.init(make_config(scans), {}, accept_payments()).error ==
         scanmint::MintError::InvalidConfiguration);

  scanmint::CoreApi no_payments;
  assert(no_payments.init(make_config(scans), fixed_meter(kSpentUnits), {}).error ==
         scanmint::MintError::InvalidConfiguration);

  scanmint::CoreApi silent;
  assert(silent.init(make_config(scans), []() -> std::optional<std::uint64_t> { return std::nullopt; },
                     accept_payments())
             .ok);
  scanmint::ClaimReceipt receipt;
  assert(silent.claim(paid_claim(participant(0), scans[0], 0), receipt).error ==
         scanmint::MintError::MeterUnavailable);
  assert(silent.next_index() == 0);
}

void test_init_rejects_bad_configuration() {
  const auto scans = make_scans();

  auto config = make_config(scans);
  config.expected_hashes.pop_back();
  scanmint::CoreApi short_hashes;
  assert(short_hashes.init(config, fixed_meter(0), accept_payments()).error ==
         scanmint::MintError::InvalidConfiguration);

  config = make_config(scans);
  config.header.clear();
  scanmint::CoreApi no_header;
  assert(no_header.init(config, fixed_meter(0), accept_payments()).error ==
         scanmint::MintError::InvalidConfiguration);

  config = make_config(scans);
  config.owner = "  ";
  scanmint::CoreApi no_owner;
  assert(no_owner.init(config, fixed_meter(0), accept_payments()).error ==
         scanmint::MintError::InvalidConfiguration);

  scanmint::CoreApi twice;
  assert(twice.init(make_config(scans), fixed_meter(0), accept_payments()).ok);
  assert(twice.init(make_config(scans), fixed_meter(0), accept_payments()).error ==
         scanmint::MintError::InvalidConfiguration);

  scanmint::CoreApi uninitialized;
  scanmint::ClaimReceipt receipt;
  assert(uninitialized.claim(paid_claim(participant(0), scans[0], 0), receipt).error ==
         scanmint::MintError::InvalidConfiguration);
  scanmint::Digest digest{};
  assert(uninitialized.expected_hash(0, digest).error == scanmint::MintError::InvalidConfiguration);
}

void test_assemble_grows_in_claim_order() {
  const auto scans = make_scans();
  scanmint::CoreApi api;
  auto config = make_config(scans);
  config.footer = "/9k=";
  assert(api.init(config, fixed_meter(kSpentUnits), accept_payments()).ok);

  scanmint::ClaimReceipt receipt;
  for (std::uint64_t i = 0; i < 12; ++i) {
    assert(api.claim(paid_claim(participant(i), scans[i], i), receipt).ok);
  }

  std::string body;
  std::string previous;
  for (std::uint64_t k = 0; k < 12; ++k) {
    body += scans[k];
    scanmint::Artifact artifact;
    assert(api.assemble(k, artifact).ok);
    assert(artifact.index == k);
    assert(artifact.bytes == std::string{kHeader} + body + "/9k=");
    assert(artifact.size_kb == body.size() / 1024U);

    if (k > 0) {
      const std::string grown = previous.substr(0, previous.size() - 4U) + scans[k] + "/9k=";
      assert(artifact.bytes == grown);
    }
    previous = artifact.bytes;
  }

  scanmint::Artifact artifact;
  assert(api.assemble(10, artifact).ok && artifact.phase == "Black & White");
  assert(api.assemble(11, artifact).ok && artifact.phase == "Color");
  assert(api.assemble(12, artifact).error == scanmint::MintError::NotYetClaimed);
  assert(api.assemble(100, artifact).error == scanmint::MintError::NotYetClaimed);

  scanmint::Digest digest{};
  assert(api.expected_hash(11, digest).ok);
  assert(digest == scanmint::util::sha256_digest(scans[11]));
}

void test_full_mint_and_withdraw() {
  const auto scans = make_scans();
  scanmint::CoreApi api;
  assert(api.init(make_config(scans), fixed_meter(kSpentUnits), accept_payments()).ok);

  std::uint64_t expected_balance = 0;
  scanmint::ClaimReceipt receipt;
  for (std::uint64_t i = 0; i < scanmint::kChunkCount; ++i) {
    assert(api.claim(paid_claim(participant(i), scans[i], i), receipt).ok);
    assert(receipt.fee == scanmint::FeeEngine::required_total_cost(i) - kSpentUnits - 260000);
    expected_balance += receipt.fee;
  }

  assert(api.next_index() == 100);
  assert(api.total_supply() == 100);
  assert(api.status().minting_complete);
  assert(api.claim(paid_claim("cid-latecomer", scans[0], 99), receipt).error ==
         scanmint::MintError::MintingComplete);
  assert(api.accumulated_balance() == expected_balance);

  scanmint::WithdrawReceipt withdrawal;
  assert(api.withdraw(participant(0), withdrawal).error == scanmint::MintError::NotAuthorized);
  assert(api.accumulated_balance() == expected_balance);

  assert(api.withdraw(kOwner, withdrawal).ok);
  assert(withdrawal.recipient == kOwner);
  assert(withdrawal.amount == expected_balance);
  assert(api.accumulated_balance() == 0);

  assert(api.withdraw(kOwner, withdrawal).ok);
  assert(withdrawal.amount == 0);

  const auto status = api.status();
  assert(status.total_collected == expected_balance);
  assert(status.total_withdrawn == expected_balance);

  scanmint::Artifact artifact;
  assert(api.assemble(99, artifact).ok);
  assert(artifact.phase == "Resolution");
  std::string body;
  for (const auto& scan : scans) {
    body += scan;
  }
  assert(artifact.bytes == std::string{kHeader} + body + std::string{scanmint::kDefaultFooter});
  assert(artifact.size_kb == body.size() / 1024U);
}

void test_token_transfers_and_metadata() {
  const auto scans = make_scans();
  scanmint::CoreApi api;
  assert(api.init(make_config(scans), fixed_meter(kSpentUnits), accept_payments()).ok);

  scanmint::ClaimReceipt receipt;
  for (std::uint64_t i = 0; i < 3; ++i) {
    assert(api.claim(paid_claim(participant(i), scans[i], i), receipt).ok);
  }

  assert(api.balance_of(participant(0)) == 1);
  assert(api.transfer_from(participant(1), participant(0), participant(1), 0).error ==
         scanmint::MintError::NotOwnerNorApproved);
  assert(api.transfer_from(participant(0), participant(0), participant(1), 7).error ==
         scanmint::MintError::NotYetClaimed);
  assert(api.transfer_from(participant(0), participant(2), participant(1), 0).error ==
         scanmint::MintError::NotOwnerNorApproved);

  assert(api.transfer_from(participant(0), participant(0), participant(1), 0).ok);
  std::string owner;
  assert(api.owner_of(0, owner).ok && owner == participant(1));
  assert(api.balance_of(participant(0)) == 0);
  assert(api.balance_of(participant(1)) == 2);
  // Giving away the copy does not restore the right to claim.
  assert(api.has_claimed(participant(0)));

  assert(api.approve(participant(2), "cid-delegate", 2).ok);
  std::string approved;
  assert(api.get_approved(2, approved).ok && approved == "cid-delegate");
  assert(api.transfer_from("cid-delegate", participant(2), "cid-buyer", 2).ok);
  assert(api.get_approved(2, approved).ok && approved.empty());
  assert(api.transfer_from("cid-delegate", "cid-buyer", participant(2), 2).error ==
         scanmint::MintError::NotOwnerNorApproved);

  assert(api.set_approval_for_all(participant(1), "cid-operator", true).ok);
  assert(api.is_approved_for_all(participant(1), "cid-operator"));
  assert(api.transfer_from("cid-operator", participant(1), "cid-buyer", 1).ok);
  assert(api.balance_of("cid-buyer") == 2);

  std::string uri;
  assert(api.token_uri(0, uri).ok);
  assert(uri.find("\"name\":\"JPEG Mining: 1 of 100 copies\"") != std::string::npos);
  assert(uri.find("\"trait_type\":\"kilobytes\",\"value\":0") != std::string::npos);
  assert(uri.find("\"trait_type\":\"phase\",\"value\":\"Black & White\"") != std::string::npos);
  assert(uri.find("\"image\":\"data:image/jpeg;base64," + std::string{kHeader} + scans[0]) != std::string::npos);

  std::string image;
  assert(api.image_uri(2, image).ok);
  assert(image == std::string{scanmint::kImageDataUriPrefix} + std::string{kHeader} + scans[0] + scans[1] +
                      scans[2] + std::string{scanmint::kDefaultFooter});
  assert(api.token_uri(3, uri).error == scanmint::MintError::NotYetClaimed);

  const auto events = api.events();
  std::size_t claimed_events = 0;
  std::size_t transfer_events = 0;
  for (std::size_t i = 0; i < events.size(); ++i) {
    assert(events[i].sequence == i);
    if (events[i].kind == scanmint::EventKind::Claimed) {
      ++claimed_events;
    } else if (events[i].kind == scanmint::EventKind::Transfer) {
      ++transfer_events;
    }
  }
  assert(claimed_events == 3);
  assert(transfer_events == 6);

  const auto claimed = scanmint::util::parse_canonical_map(events[1].payload);
  assert(events[1].kind == scanmint::EventKind::Claimed);
  assert(claimed.at("caller") == participant(0));
  assert(claimed.at("required_total_cost") == "3000000");
  assert(claimed.at("phase") == "Black & White");
}

void test_manifest_and_journal_round_trip() {
  const auto scans = make_scans();
  const auto dir = temp_dir("manifest-journal");

  auto config = make_config(scans);
  config.collection_name = "Test Mining";
  config.journal_path = (dir / "journal" / "events.log").string();
  const auto manifest_path = dir / "manifest.txt";
  assert(scanmint::write_manifest(manifest_path.string(), config).ok);

  scanmint::MinerConfig loaded;
  const scanmint::Result parsed = scanmint::load_manifest(manifest_path.string(), loaded);
  assert(parsed.ok);
  assert(loaded.header == kHeader);
  assert(loaded.footer == scanmint::kDefaultFooter);
  assert(loaded.owner == kOwner);
  assert(loaded.collection_name == "Test Mining");
  assert(loaded.journal_path == config.journal_path);
  assert(loaded.expected_hashes == config.expected_hashes);

  assert(scanmint::parse_manifest("footer=x\nowner=o\n", loaded).error ==
         scanmint::MintError::InvalidConfiguration);
  assert(scanmint::parse_manifest("header=h\nowner=o\nhash.0=zz\n", loaded).error ==
         scanmint::MintError::InvalidConfiguration);
  assert(scanmint::parse_manifest("header=h\nowner=o\nhash.1=" + std::string(64, 'a') + "\n", loaded).error ==
         scanmint::MintError::InvalidConfiguration);

  scanmint::CoreApi api;
  assert(api.init_from_manifest(manifest_path.string(), fixed_meter(kSpentUnits), accept_payments()).ok);
  scanmint::ClaimReceipt receipt;
  assert(api.claim(paid_claim(participant(0), scans[0], 0), receipt).ok);
  scanmint::WithdrawReceipt withdrawal;
  assert(api.withdraw(kOwner, withdrawal).ok);

  const auto status = api.status();
  assert(status.journal_error.empty());
  assert(std::filesystem::exists(status.journal_path));

  std::vector<scanmint::EventEnvelope> journaled;
  assert(scanmint::EventJournal::read(status.journal_path, journaled).ok);
  assert(journaled.size() == 3);
  assert(journaled[0].kind == scanmint::EventKind::Transfer);
  assert(journaled[1].kind == scanmint::EventKind::Claimed);
  assert(journaled[1].event_id == receipt.event_id);
  assert(journaled[2].kind == scanmint::EventKind::Withdrawn);
  assert(journaled[2].actor == kOwner);
  const auto withdrawn = scanmint::util::parse_canonical_map(journaled[2].payload);
  assert(withdrawn.at("amount") == std::to_string(withdrawal.amount));

  const auto in_memory = api.events();
  assert(in_memory.size() == journaled.size());
  for (std::size_t i = 0; i < in_memory.size(); ++i) {
    assert(in_memory[i].event_id == journaled[i].event_id);
    assert(in_memory[i].payload == journaled[i].payload);
  }
}

void test_host_callbacks_can_read_the_ledger() {
  const auto scans = make_scans();
  scanmint::CoreApi api;
  std::vector<std::uint64_t> cursors_seen;
  std::vector<std::uint64_t> balances_seen;
  std::vector<scanmint::Result> nested_claims;

  assert(api.init(
                make_config(scans),
                [&api, &cursors_seen]() -> std::optional<std::uint64_t> {
                  cursors_seen.push_back(api.next_index());
                  return kSpentUnits;
                },
                [&api, &scans, &balances_seen, &nested_claims](std::string_view, std::uint64_t) {
                  balances_seen.push_back(api.accumulated_balance());
                  const std::uint64_t cursor = api.status().next_index;
                  scanmint::ClaimReceipt inner;
                  nested_claims.push_back(api.claim(paid_claim("cid-nested", scans[cursor], cursor), inner));
                  return true;
                })
             .ok);

  // Each claim overpays, so the sink runs while the claim is in flight.
  scanmint::ClaimReceipt receipt;
  assert(api.claim(paid_claim(participant(0), scans[0], 0), receipt).ok);
  const std::uint64_t first_fee = receipt.fee;
  assert(api.claim(paid_claim(participant(1), scans[1], 1), receipt).ok);
  const std::uint64_t second_fee = receipt.fee;

  // Callbacks see the ledger as it stood before the claim they belong to.
  assert((cursors_seen == std::vector<std::uint64_t>{0, 1}));
  assert((balances_seen == std::vector<std::uint64_t>{0, first_fee}));

  scanmint::WithdrawReceipt withdrawal;
  assert(api.withdraw(kOwner, withdrawal).ok);
  assert(withdrawal.amount == first_fee + second_fee);
  assert(balances_seen.back() == first_fee + second_fee);
  assert(api.accumulated_balance() == 0);

  // Writes from inside a callback are refused rather than left waiting.
  assert(nested_claims.size() == 3);
  for (const auto& nested : nested_claims) {
    assert(nested.error == scanmint::MintError::ReentrantWrite);
  }
  assert(!api.has_claimed("cid-nested"));
  assert(api.next_index() == 2);
  assert(api.status().event_count == 5);
}

void test_withdraw_pays_out_before_clearing_balance() {
  const auto scans = make_scans();
  std::vector<std::pair<std::string, std::uint64_t>> payments;
  bool owner_reachable = true;

  scanmint::CoreApi api;
  assert(api.init(make_config(scans), fixed_meter(kSpentUnits),
                  [&payments, &owner_reachable](std::string_view recipient, std::uint64_t amount) {
                    if (recipient == kOwner && !owner_reachable) {
                      return false;
                    }
                    payments.emplace_back(std::string{recipient}, amount);
                    return true;
                  })
             .ok);

  scanmint::ClaimReceipt receipt;
  std::uint64_t collected = 0;
  for (std::uint64_t i = 0; i < 2; ++i) {
    assert(api.claim(paid_claim(participant(i), scans[i], i), receipt).ok);
    collected += receipt.fee;
  }
  assert(payments.size() == 2);
  const std::size_t events_before = api.status().event_count;

  owner_reachable = false;
  scanmint::WithdrawReceipt withdrawal;
  const scanmint::Result failed = api.withdraw(kOwner, withdrawal);
  assert(failed.error == scanmint::MintError::PayoutFailed);
  auto status = api.status();
  assert(status.accumulated_balance == collected);
  assert(status.total_withdrawn == 0);
  assert(status.event_count == events_before);
  assert(withdrawal.amount == 0);

  owner_reachable = true;
  assert(api.withdraw(kOwner, withdrawal).ok);
  assert(withdrawal.amount == collected);
  assert(payments.size() == 3);
  assert(payments.back().first == kOwner);
  assert(payments.back().second == collected);
  status = api.status();
  assert(status.accumulated_balance == 0);
  assert(status.total_withdrawn == collected);

  // Nothing to send, so the sink is not called.
  assert(api.withdraw(kOwner, withdrawal).ok);
  assert(withdrawal.amount == 0);
  assert(payments.size() == 3);
}

void test_staged_claim_commits_into_reserved_state() {
  const auto scans = make_scans();
  scanmint::ChunkRegistry registry;
  assert(scanmint::ChunkRegistry::create(scanmint::hash_scans(scans), std::string{kHeader}, "", registry).ok);

  scanmint::MintState state;
  const scanmint::ClaimRequest request = paid_claim(participant(0), scans[0], 0);
  scanmint::PendingClaim pending;
  assert(scanmint::check_claim(state, registry, request, pending).ok);
  assert(scanmint::price_claim(fixed_meter(kSpentUnits), request, pending).ok);
  scanmint::stage_claim(state, request, pending);

  assert(state.ledger.next_index() == 0);
  assert(!state.ledger.has_claimed(participant(0)));
  assert(state.store.size() == 0);
  assert(state.tokens.total_supply() == 0);
  assert(state.events.empty());
  assert(state.events.capacity() >= 2);
  assert(state.accumulated_balance == 0);
  assert(pending.events.size() == 2);
  assert(pending.receipt.event_id == pending.events.back().event_id);

  scanmint::ClaimReceipt receipt;
  scanmint::commit_claim(state, request, pending, receipt);
  assert(state.ledger.next_index() == 1);
  assert(state.ledger.has_claimed(participant(0)));
  assert(state.store.prefix(0) == scans[0]);
  assert(state.tokens.balance_of(participant(0)) == 1);
  assert(state.events.size() == 2);
  assert(state.events[1].event_id == receipt.event_id);
  assert(state.accumulated_balance == receipt.fee);
  assert(receipt.refund == pending.settlement.refund);
}

void test_journal_catches_up_after_failed_append() {
  const auto scans = make_scans();
  const auto dir = temp_dir("journal-retry");
  const auto journal_path = dir / "events.log";
  const auto parked_path = dir / "events.parked";

  auto config = make_config(scans);
  config.journal_path = journal_path.string();
  scanmint::CoreApi api;
  assert(api.init(config, fixed_meter(kSpentUnits), accept_payments()).ok);

  scanmint::ClaimReceipt receipt;
  assert(api.claim(paid_claim(participant(0), scans[0], 0), receipt).ok);
  assert(api.status().journaled_events == 2);

  // A directory in place of the journal file makes appends fail.
  std::filesystem::rename(journal_path, parked_path);
  std::filesystem::create_directory(journal_path);
  const scanmint::Result degraded = api.claim(paid_claim(participant(1), scans[1], 1), receipt);
  assert(degraded.ok);
  assert(degraded.message.find("Journal write failed") != std::string::npos);
  auto status = api.status();
  assert(!status.journal_error.empty());
  assert(status.journaled_events == 2);
  assert(status.event_count == 4);

  std::filesystem::remove(journal_path);
  std::filesystem::rename(parked_path, journal_path);
  assert(api.claim(paid_claim(participant(2), scans[2], 2), receipt).ok);
  status = api.status();
  assert(status.journal_error.empty());
  assert(status.journaled_events == 6);

  std::vector<scanmint::EventEnvelope> journaled;
  assert(scanmint::EventJournal::read(journal_path.string(), journaled).ok);
  const auto in_memory = api.events();
  assert(journaled.size() == in_memory.size());
  for (std::size_t i = 0; i < journaled.size(); ++i) {
    assert(journaled[i].sequence == i);
    assert(journaled[i].event_id == in_memory[i].event_id);
  }
}

}  // namespace

int main() {
  test_hash_and_canonical_helpers();
  test_chunk_registry_requires_exact_hash_count();
  test_chunk_store_is_append_only();
  test_claim_ledger_ordering_and_uniqueness();
  test_fee_schedule();
  test_phase_boundaries();
  test_claims_consume_next_index();
  test_rejected_claims_leave_state_untouched();
  test_settlement_refunds_overpayment();
  test_meter_is_required();
  test_init_rejects_bad_configuration();
  test_assemble_grows_in_claim_order();
  test_full_mint_and_withdraw();
  test_token_transfers_and_metadata();
  test_manifest_and_journal_round_trip();
  test_host_callbacks_can_read_the_ledger();
  test_withdraw_pays_out_before_clearing_balance();
  test_staged_claim_commits_into_reserved_state();
  test_journal_catches_up_after_failed_append();

  std::cout << "scanmint_unit_tests passed\n";
  return 0;
}
