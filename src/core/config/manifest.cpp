#include "core/config/manifest.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace scanmint {
namespace {

constexpr std::string_view kHashKeyPrefix = "hash.";

std::string hash_key(std::size_t index) {
  return std::string{kHashKeyPrefix} + std::to_string(index);
}

}  // namespace

Result parse_manifest(std::string_view text, MinerConfig& out) {
  const auto fields = util::parse_canonical_map(text);

  MinerConfig config;
  const auto header = fields.find("header");
  if (header == fields.end() || header->second.empty()) {
    return Result::failure(MintError::InvalidConfiguration, "Manifest is missing the header fragment.");
  }
  config.header = header->second;

  if (const auto footer = fields.find("footer"); footer != fields.end()) {
    config.footer = footer->second;
  }

  const auto owner = fields.find("owner");
  if (owner == fields.end() || util::trim_copy(owner->second).empty()) {
    return Result::failure(MintError::InvalidConfiguration, "Manifest is missing the owner identity.");
  }
  config.owner = util::trim_copy(owner->second);

  if (const auto collection = fields.find("collection"); collection != fields.end() &&
                                                          !collection->second.empty()) {
    config.collection_name = collection->second;
  }
  if (const auto description = fields.find("description"); description != fields.end()) {
    config.description = description->second;
  }
  if (const auto journal = fields.find("journal"); journal != fields.end()) {
    config.journal_path = util::trim_copy(journal->second);
  }

  std::size_t hash_fields = 0;
  for (const auto& [key, value] : fields) {
    (void)value;
    if (key.starts_with(kHashKeyPrefix)) {
      ++hash_fields;
    }
  }

  for (std::size_t i = 0; i < hash_fields; ++i) {
    const auto entry = fields.find(hash_key(i));
    if (entry == fields.end()) {
      return Result::failure(MintError::InvalidConfiguration,
                             "Manifest hash list has a gap at " + hash_key(i) + ".");
    }
    Digest digest{};
    if (!util::digest_from_hex(util::trim_copy(entry->second), digest)) {
      return Result::failure(MintError::InvalidConfiguration,
                             "Manifest " + hash_key(i) + " is not a 32-byte hex digest.");
    }
    config.expected_hashes.push_back(digest);
  }

  out = std::move(config);
  return Result::success("Manifest parsed with " + std::to_string(hash_fields) + " scan hashes.");
}

Result load_manifest(std::string_view path, MinerConfig& out) {
  std::ifstream in(std::filesystem::path{std::string{path}}, std::ios::in | std::ios::binary);
  if (!in) {
    return Result::failure(MintError::InvalidConfiguration, "Unable to read manifest: " + std::string{path});
  }

  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_manifest(ss.str(), out);
}

std::string render_manifest(const MinerConfig& config) {
  std::vector<std::pair<std::string, std::string>> fields{
      {"header", config.header},
      {"footer", config.footer},
      {"owner", config.owner},
      {"collection", config.collection_name},
      {"description", config.description},
  };
  if (!config.journal_path.empty()) {
    fields.emplace_back("journal", config.journal_path);
  }
  for (std::size_t i = 0; i < config.expected_hashes.size(); ++i) {
    fields.emplace_back(hash_key(i), util::digest_to_hex(config.expected_hashes[i]));
  }
  return util::canonical_join(std::move(fields));
}

Result write_manifest(std::string_view path, const MinerConfig& config) {
  const std::filesystem::path target{std::string{path}};
  if (target.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      return Result::failure(MintError::InvalidConfiguration,
                             "Unable to create manifest directory: " + ec.message());
    }
  }

  std::ofstream out(target, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) {
    return Result::failure(MintError::InvalidConfiguration, "Unable to write manifest: " + target.string());
  }
  const std::string text = render_manifest(config);
  out.write(text.data(), static_cast<std::streamsize>(text.size()));
  if (!out) {
    return Result::failure(MintError::InvalidConfiguration, "Manifest write was truncated.");
  }
  return Result::success("Manifest written.", target.string());
}

std::vector<Digest> hash_scans(const std::vector<std::string>& scans) {
  std::vector<Digest> digests;
  digests.reserve(scans.size());
  for (const auto& scan : scans) {
    digests.push_back(util::sha256_digest(scan));
  }
  return digests;
}

}  // namespace scanmint
