#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/config/manifest.hpp"
#include "core/mint/fee_engine.hpp"
#include "core/model/app_meta.hpp"
#include "core/storage/event_journal.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace {

// Modeled host costs for offline simulation.
constexpr std::uint64_t kTxBaseUnits = 21000;
constexpr std::uint64_t kCalldataUnitsPerByte = 16;
constexpr std::uint64_t kStorageUnitsPerWord = 640;
constexpr std::uint64_t kDefaultUnitPrice = 100;

void print_usage() {
  std::cout << scanmint::kAppDisplayName << " " << scanmint::kAppVersion << " (" << scanmint::kBuildRelease
            << ")\n\n"
            << "Usage:\n"
            << "  scanmint-cli manifest <scans-file> <out-manifest> <owner> [collection]\n"
            << "  scanmint-cli quote <index> [spent-units] [unit-price]\n"
            << "  scanmint-cli phase <index>\n"
            << "  scanmint-cli simulate <manifest> <scans-file> <out-image> [unit-price]\n"
            << "  scanmint-cli journal <events.log>\n\n"
            << "A scans file holds the encoded header on its first line and one encoded scan per line after it.\n";
}

bool read_text(const std::filesystem::path& path, std::string& out) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

bool read_scans(std::string_view path, std::string& header, std::vector<std::string>& scans) {
  std::string text;
  if (!read_text(std::filesystem::path{std::string{path}}, text)) {
    std::cerr << "Unable to read scans file: " << path << '\n';
    return false;
  }
  std::vector<std::string> lines = scanmint::util::split_lines(text);
  if (lines.empty()) {
    std::cerr << "Scans file is empty: " << path << '\n';
    return false;
  }
  header = lines.front();
  scans.assign(lines.begin() + 1, lines.end());
  return true;
}

bool parse_index_arg(std::string_view text, std::uint64_t& out) {
  if (!scanmint::util::parse_uint64(text, out)) {
    std::cerr << "Not an unsigned integer: " << text << '\n';
    return false;
  }
  return true;
}

std::uint64_t modeled_claim_units(std::size_t payload_bytes) {
  const std::uint64_t words = (payload_bytes + 31U) / 32U;
  return kTxBaseUnits + kCalldataUnitsPerByte * payload_bytes + kStorageUnitsPerWord * words;
}

int run_manifest(const std::vector<std::string_view>& args) {
  if (args.size() < 3) {
    print_usage();
    return 2;
  }

  scanmint::MinerConfig config;
  std::vector<std::string> scans;
  if (!read_scans(args[0], config.header, scans)) {
    return 1;
  }
  if (scans.size() != scanmint::kChunkCount) {
    std::cerr << "Expected " << scanmint::kChunkCount << " scans, found " << scans.size() << ".\n";
    return 1;
  }
  config.owner = std::string{args[2]};
  if (args.size() > 3) {
    config.collection_name = std::string{args[3]};
  }
  config.expected_hashes = scanmint::hash_scans(scans);

  const scanmint::Result written = scanmint::write_manifest(args[1], config);
  if (!written.ok) {
    std::cerr << written.message << '\n';
    return 1;
  }
  std::cout << "Manifest with " << config.expected_hashes.size() << " scan hashes written to " << written.data
            << '\n';
  return 0;
}

int run_quote(const std::vector<std::string_view>& args) {
  if (args.empty()) {
    print_usage();
    return 2;
  }

  std::uint64_t index = 0;
  std::uint64_t spent = 0;
  std::uint64_t unit_price = 1;
  if (!parse_index_arg(args[0], index) || (args.size() > 1 && !parse_index_arg(args[1], spent)) ||
      (args.size() > 2 && !parse_index_arg(args[2], unit_price))) {
    return 2;
  }
  scanmint::CoreApi api;
  scanmint::FeeQuote quote;
  if (const scanmint::Result quoted = api.quote(index, spent, unit_price, quote); !quoted.ok) {
    std::cerr << quoted.message << '\n';
    return 1;
  }
  std::cout << "index=" << quote.index << '\n'
            << "required_total_cost=" << quote.required_total_cost << '\n'
            << "spent_units=" << quote.spent_units << '\n'
            << "billable_units=" << quote.billable_units << '\n'
            << "unit_price=" << quote.unit_price << '\n';
  if (quote.fee_overflow) {
    std::cout << "required_fee=overflow\n";
  } else {
    std::cout << "required_fee=" << quote.required_fee << '\n';
  }
  return 0;
}

int run_phase(const std::vector<std::string_view>& args) {
  if (args.empty()) {
    print_usage();
    return 2;
  }

  std::uint64_t index = 0;
  if (!parse_index_arg(args[0], index)) {
    return 2;
  }
  scanmint::CoreApi api;
  std::string phase;
  const scanmint::Result phased = api.phase(index, phase);
  if (!phased.ok) {
    std::cerr << phased.message << '\n';
    return 1;
  }
  std::cout << phase << '\n';
  return 0;
}

int run_simulate(const std::vector<std::string_view>& args) {
  if (args.size() < 3) {
    print_usage();
    return 2;
  }

  std::uint64_t unit_price = kDefaultUnitPrice;
  if (args.size() > 3 && !parse_index_arg(args[3], unit_price)) {
    return 2;
  }

  std::string header;
  std::vector<std::string> scans;
  if (!read_scans(args[1], header, scans)) {
    return 1;
  }

  auto pending_payload_bytes = std::make_shared<std::size_t>(0);
  auto paid_out = std::make_shared<std::unordered_map<std::string, std::uint64_t>>();

  scanmint::CoreApi api;
  const scanmint::Result init = api.init_from_manifest(
      args[0],
      [pending_payload_bytes]() -> std::optional<std::uint64_t> {
        return modeled_claim_units(*pending_payload_bytes);
      },
      [paid_out](std::string_view recipient, std::uint64_t amount) {
        (*paid_out)[std::string{recipient}] += amount;
        return true;
      });
  if (!init.ok) {
    std::cerr << "Init failed [" << scanmint::mint_error_name(init.error) << "]: " << init.message << '\n';
    return 1;
  }
  const std::string owner = api.status().owner;

  for (std::size_t i = 0; i < scans.size(); ++i) {
    const std::string participant = "participant-" + std::to_string(i);
    const std::uint64_t index = api.next_index();
    *pending_payload_bytes = scans[i].size();

    scanmint::ClaimReceipt receipt;
    const scanmint::Result claimed = api.claim(
        {
            .caller = participant,
            .payload = scans[i],
            .attached_value = scanmint::FeeEngine::required_total_cost(index) * unit_price,
            .unit_price = unit_price,
        },
        receipt);
    if (!claimed.ok) {
      std::cerr << "Claim " << index << " by " << participant << " failed ["
                << scanmint::mint_error_name(claimed.error) << "]: " << claimed.message << '\n';
      return 1;
    }
    std::cout << "scan " << receipt.index << " -> " << participant << " cost=" << receipt.required_total_cost
              << " spent=" << receipt.spent_units << " fee=" << receipt.fee << " refund=" << receipt.refund
              << " phase=" << receipt.phase << '\n';
  }

  scanmint::WithdrawReceipt withdrawal;
  const scanmint::Result withdrawn = api.withdraw(owner, withdrawal);
  if (!withdrawn.ok) {
    std::cerr << "Withdraw failed: " << withdrawn.message << '\n';
    return 1;
  }
  std::cout << "Owner " << withdrawal.recipient << " withdrew " << withdrawal.amount << " (paid out "
            << (*paid_out)[withdrawal.recipient] << ")\n";

  if (api.next_index() == 0) {
    std::cout << "No scans were claimed; no image written.\n";
    return 0;
  }

  scanmint::Artifact artifact;
  const scanmint::Result assembled = api.assemble(api.next_index() - 1U, artifact);
  if (!assembled.ok) {
    std::cerr << assembled.message << '\n';
    return 1;
  }

  std::ofstream out(std::filesystem::path{std::string{args[2]}}, std::ios::out | std::ios::binary | std::ios::trunc);
  out.write(artifact.bytes.data(), static_cast<std::streamsize>(artifact.bytes.size()));
  if (!out) {
    std::cerr << "Unable to write image: " << args[2] << '\n';
    return 1;
  }
  std::cout << "Assembled image through scan " << artifact.index << " (" << artifact.size_kb << " KiB, "
            << artifact.phase << ") written to " << args[2] << '\n';

  const auto status = api.status();
  if (!status.journal_error.empty()) {
    std::cerr << "Journal: " << status.journal_error << '\n';
  }
  return 0;
}

int run_journal(const std::vector<std::string_view>& args) {
  if (args.empty()) {
    print_usage();
    return 2;
  }

  std::vector<scanmint::EventEnvelope> events;
  const scanmint::Result read = scanmint::EventJournal::read(args[0], events);
  if (!read.ok) {
    std::cerr << read.message << '\n';
    return 1;
  }
  for (const auto& event : events) {
    std::cout << '#' << event.sequence << ' ' << scanmint::event_kind_name(event.kind) << ' ' << event.event_id
              << " actor=" << event.actor << '\n';
    for (const auto& [key, value] : scanmint::util::parse_canonical_map(event.payload)) {
      std::cout << "    " << key << '=' << value << '\n';
    }
  }
  std::cout << read.message << '\n';
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 2;
  }
  if (!scanmint::util::ensure_crypto_ready()) {
    std::cerr << "libsodium initialization failed.\n";
    return 1;
  }

  const std::string_view command{argv[1]};
  std::vector<std::string_view> args;
  for (int i = 2; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  if (command == "manifest") {
    return run_manifest(args);
  }
  if (command == "quote") {
    return run_quote(args);
  }
  if (command == "phase") {
    return run_phase(args);
  }
  if (command == "simulate") {
    return run_simulate(args);
  }
  if (command == "journal") {
    return run_journal(args);
  }

  print_usage();
  return 2;
}
