#include "core/storage/chunk_store.hpp"

#include <algorithm>
#include <stdexcept>

namespace scanmint {

void ChunkStore::put(std::uint64_t index, std::string_view payload) {
  if (index < end_offsets_.size()) {
    throw std::logic_error("Chunk store slot " + std::to_string(index) + " already claimed.");
  }
  if (index != end_offsets_.size()) {
    throw std::logic_error("Chunk store write for slot " + std::to_string(index) + " skips slot " +
                           std::to_string(end_offsets_.size()) + ".");
  }

  body_.append(payload.data(), payload.size());
  end_offsets_.push_back(body_.size());
}

void ChunkStore::reserve_next(std::size_t payload_bytes) {
  if (body_.capacity() - body_.size() < payload_bytes) {
    body_.reserve(std::max(body_.size() + payload_bytes, body_.capacity() * 2U));
  }
  if (end_offsets_.capacity() == end_offsets_.size()) {
    end_offsets_.reserve(std::max<std::size_t>(kChunkCount, end_offsets_.size() * 2U));
  }
}

Result ChunkStore::get(std::uint64_t index, std::string& out) const {
  if (!contains(index)) {
    return Result::failure(MintError::NotYetClaimed,
                           "Scan " + std::to_string(index) + " has not been claimed yet.");
  }

  const auto slot = static_cast<std::size_t>(index);
  const std::size_t begin = slot == 0 ? 0 : end_offsets_[slot - 1U];
  out.assign(body_, begin, end_offsets_[slot] - begin);
  return Result::success();
}

std::string_view ChunkStore::prefix(std::uint64_t index) const {
  if (!contains(index)) {
    return {};
  }
  return std::string_view{body_}.substr(0, end_offsets_[static_cast<std::size_t>(index)]);
}

}  // namespace scanmint
