#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace scanmint {

// Append-only store of claimed scan payloads. Payloads sit back to back in one
// buffer with a cumulative end offset per index, so any claimed prefix is a
// single contiguous range.
class ChunkStore {
public:
  // Throws std::logic_error unless index is exactly the next unfilled slot.
  void put(std::uint64_t index, std::string_view payload);

  // Grows capacity so the next put of up to payload_bytes does not allocate.
  void reserve_next(std::size_t payload_bytes);

  Result get(std::uint64_t index, std::string& out) const;

  [[nodiscard]] bool contains(std::uint64_t index) const { return index < end_offsets_.size(); }
  [[nodiscard]] std::uint64_t size() const { return end_offsets_.size(); }

  // payload[0] ++ ... ++ payload[index]; empty when index is not stored.
  [[nodiscard]] std::string_view prefix(std::uint64_t index) const;
  [[nodiscard]] std::size_t total_bytes() const { return body_.size(); }

private:
  std::string body_;
  std::vector<std::size_t> end_offsets_;
};

}  // namespace scanmint
