#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace scanmint {

// Expected scan digests plus the header/footer that frame the assembled image.
// Fixed once created.
class ChunkRegistry {
public:
  static Result create(std::vector<Digest> expected_hashes, std::string header, std::string footer,
                       ChunkRegistry& out);

  Result expected_hash(std::uint64_t index, Digest& out) const;
  [[nodiscard]] bool matches(std::uint64_t index, std::string_view payload) const;

  [[nodiscard]] std::uint64_t size() const { return expected_hashes_.size(); }
  [[nodiscard]] const std::string& header() const { return header_; }
  [[nodiscard]] const std::string& footer() const { return footer_; }

private:
  std::vector<Digest> expected_hashes_;
  std::string header_;
  std::string footer_;
};

}  // namespace scanmint
