#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "core/mint/chunk_registry.hpp"
#include "core/model/types.hpp"
#include "core/storage/chunk_store.hpp"

namespace scanmint {

// Read-only view that rebuilds the image as it stood after a given claim.
class ArtifactAssembler {
public:
  ArtifactAssembler(const ChunkRegistry& registry, const ChunkStore& store)
      : registry_(registry), store_(store) {}

  Result assemble(std::uint64_t up_to_index, Artifact& out) const;

  // Depends only on the index, never on claim state.
  static Result phase(std::uint64_t index, std::string_view& out);

private:
  const ChunkRegistry& registry_;
  const ChunkStore& store_;
};

}  // namespace scanmint
