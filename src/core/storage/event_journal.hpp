#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/model/types.hpp"

namespace scanmint {

std::string_view event_kind_name(EventKind kind);
bool event_kind_from_name(std::string_view text, EventKind& out);

EventEnvelope make_event(EventKind kind, std::string_view actor, std::uint64_t sequence,
                         std::vector<std::pair<std::string, std::string>> fields);

// Append-only, line-per-event record of ledger activity:
//   event_id \t kind \t actor \t sequence \t unix_ts \t hex(payload)
class EventJournal {
public:
  Result open(std::string_view path);
  [[nodiscard]] bool is_open() const { return !path_.empty(); }
  [[nodiscard]] const std::string& path() const { return path_; }

  Result append(const EventEnvelope& event) const;

  static Result read(std::string_view path, std::vector<EventEnvelope>& out);

private:
  std::string path_;
};

}  // namespace scanmint
