#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace scanmint::util {

std::int64_t unix_timestamp_now();

std::string trim_copy(std::string_view value);
std::vector<std::string> split_lines(std::string_view text);

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields);
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload);

std::string to_hex(std::string_view bytes);
std::string from_hex(std::string_view hex);

bool parse_uint64(std::string_view text, std::uint64_t& out);
bool parse_int64(std::string_view text, std::int64_t& out);

std::string json_escape(std::string_view value);

}  // namespace scanmint::util
