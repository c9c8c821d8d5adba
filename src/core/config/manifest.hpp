#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace scanmint {

// A manifest is a canonical key=value file:
//   header=<encoded header>   footer=<encoded footer>   owner=<identity>
//   collection=<name>         description=<text>        journal=<path>
//   hash.<i>=<64 hex chars>   for i in [0, chunk count)
Result parse_manifest(std::string_view text, MinerConfig& out);
Result load_manifest(std::string_view path, MinerConfig& out);

std::string render_manifest(const MinerConfig& config);
Result write_manifest(std::string_view path, const MinerConfig& config);

// Hashes each scan payload in order; the basis for a fresh manifest.
std::vector<Digest> hash_scans(const std::vector<std::string>& scans);

}  // namespace scanmint
