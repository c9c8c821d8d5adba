#include "core/storage/event_journal.hpp"

#include <array>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace scanmint {
namespace {

std::string serialize_event_line(const EventEnvelope& event) {
  std::ostringstream out;
  out << event.event_id << '\t' << event_kind_name(event.kind) << '\t' << event.actor << '\t'
      << event.sequence << '\t' << event.unix_ts << '\t' << util::to_hex(event.payload) << '\n';
  return out.str();
}

bool parse_event_line(std::string_view line, EventEnvelope& out) {
  std::array<std::string_view, 6> fields{};
  std::size_t field_index = 0;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= line.size(); ++i) {
    if (i == line.size() || line[i] == '\t') {
      if (field_index >= fields.size()) {
        return false;
      }
      fields[field_index++] = line.substr(start, i - start);
      start = i + 1U;
    }
  }

  if (field_index != fields.size()) {
    return false;
  }

  out.event_id = std::string{fields[0]};
  if (!event_kind_from_name(fields[1], out.kind)) {
    return false;
  }
  out.actor = std::string{fields[2]};
  if (!util::parse_uint64(fields[3], out.sequence)) {
    return false;
  }
  if (!util::parse_int64(fields[4], out.unix_ts)) {
    return false;
  }
  out.payload = util::from_hex(fields[5]);
  return !out.event_id.empty() && !out.payload.empty();
}

}  // namespace

std::string_view event_kind_name(EventKind kind) {
  switch (kind) {
    case EventKind::Claimed:
      return "Claimed";
    case EventKind::Transfer:
      return "Transfer";
    case EventKind::Approval:
      return "Approval";
    case EventKind::ApprovalForAll:
      return "ApprovalForAll";
    case EventKind::Withdrawn:
      return "Withdrawn";
  }
  return "Claimed";
}

bool event_kind_from_name(std::string_view text, EventKind& out) {
  if (text == "Claimed") {
    out = EventKind::Claimed;
  } else if (text == "Transfer") {
    out = EventKind::Transfer;
  } else if (text == "Approval") {
    out = EventKind::Approval;
  } else if (text == "ApprovalForAll") {
    out = EventKind::ApprovalForAll;
  } else if (text == "Withdrawn") {
    out = EventKind::Withdrawn;
  } else {
    return false;
  }
  return true;
}

EventEnvelope make_event(EventKind kind, std::string_view actor, std::uint64_t sequence,
                         std::vector<std::pair<std::string, std::string>> fields) {
  EventEnvelope event;
  event.kind = kind;
  event.actor = std::string{actor};
  event.sequence = sequence;
  event.unix_ts = util::unix_timestamp_now();
  event.payload = util::canonical_join(std::move(fields));
  event.event_id = "evt-" + util::sha256_hex(std::string{event_kind_name(kind)} + "|" + event.actor + "|" +
                                             std::to_string(sequence) + "|" + event.payload)
                                .substr(0, 16);
  return event;
}

Result EventJournal::open(std::string_view path) {
  if (path.empty()) {
    return Result::failure(MintError::InvalidConfiguration, "Journal path is empty.");
  }

  const std::filesystem::path journal{std::string{path}};
  if (journal.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(journal.parent_path(), ec);
    if (ec) {
      return Result::failure(MintError::InvalidConfiguration,
                             "Failed to create journal directory: " + ec.message());
    }
  }

  std::ofstream out(journal, std::ios::out | std::ios::binary | std::ios::app);
  if (!out) {
    return Result::failure(MintError::InvalidConfiguration, "Failed to open journal: " + journal.string());
  }

  path_ = journal.string();
  return Result::success("Journal opened.", path_);
}

Result EventJournal::append(const EventEnvelope& event) const {
  if (!is_open()) {
    return Result::success("Journal disabled.");
  }

  std::ofstream out(path_, std::ios::out | std::ios::binary | std::ios::app);
  if (!out) {
    return Result::failure(MintError::InvalidConfiguration, "Failed to open journal for append.");
  }
  out << serialize_event_line(event);
  if (!out) {
    return Result::failure(MintError::InvalidConfiguration, "Failed to append event to journal.");
  }
  return Result::success();
}

Result EventJournal::read(std::string_view path, std::vector<EventEnvelope>& out) {
  std::ifstream in(std::filesystem::path{std::string{path}}, std::ios::in | std::ios::binary);
  if (!in) {
    return Result::failure(MintError::InvalidConfiguration, "Failed to open journal: " + std::string{path});
  }

  out.clear();
  std::size_t skipped = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    EventEnvelope event;
    if (!parse_event_line(line, event)) {
      ++skipped;
      continue;
    }
    out.push_back(std::move(event));
  }

  if (skipped > 0) {
    return Result::success("Journal read with " + std::to_string(skipped) + " malformed line(s) skipped.");
  }
  return Result::success("Journal read.");
}

}  // namespace scanmint
