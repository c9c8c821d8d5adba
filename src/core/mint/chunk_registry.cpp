#include "core/mint/chunk_registry.hpp"

#include <utility>

#include "core/util/hash.hpp"

namespace scanmint {

Result ChunkRegistry::create(std::vector<Digest> expected_hashes, std::string header, std::string footer,
                             ChunkRegistry& out) {
  if (expected_hashes.size() != kChunkCount) {
    return Result::failure(MintError::InvalidConfiguration,
                           "Expected " + std::to_string(kChunkCount) + " scan hashes, got " +
                               std::to_string(expected_hashes.size()) + ".");
  }
  if (header.empty()) {
    return Result::failure(MintError::InvalidConfiguration, "Image header fragment is required.");
  }

  ChunkRegistry registry;
  registry.expected_hashes_ = std::move(expected_hashes);
  registry.header_ = std::move(header);
  registry.footer_ = std::move(footer);
  out = std::move(registry);
  return Result::success("Chunk registry sealed with " + std::to_string(kChunkCount) + " hashes.");
}

Result ChunkRegistry::expected_hash(std::uint64_t index, Digest& out) const {
  if (index >= expected_hashes_.size()) {
    return Result::failure(MintError::IndexOutOfRange,
                           "Scan index " + std::to_string(index) + " is out of range.");
  }
  out = expected_hashes_[static_cast<std::size_t>(index)];
  return Result::success();
}

bool ChunkRegistry::matches(std::uint64_t index, std::string_view payload) const {
  if (index >= expected_hashes_.size()) {
    return false;
  }
  return util::sha256_digest(payload) == expected_hashes_[static_cast<std::size_t>(index)];
}

}  // namespace scanmint
