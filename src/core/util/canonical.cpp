#include "core/util/canonical.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <iterator>
#include <ranges>
#include <system_error>

namespace scanmint::util {
namespace {

int from_hex_digit(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

void append_escaped(std::string& out, std::string_view value) {
  for (char c : value) {
    switch (c) {
      case '\n':
        out.append("\\n");
        break;
      case '\\':
        out.append("\\\\");
        break;
      default:
        out.push_back(c);
        break;
    }
  }
}

// Inverse of append_escaped. An unknown escape keeps the escaped character.
std::string unescape(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] != '\\' || i + 1U == value.size()) {
      out.push_back(value[i]);
      continue;
    }
    const char next = value[++i];
    out.push_back(next == 'n' ? '\n' : next);
  }
  return out;
}

}  // namespace

std::int64_t unix_timestamp_now() {
  return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()).time_since_epoch().count();
}

std::string trim_copy(std::string_view value) {
  const auto first = std::ranges::find_if_not(value, is_space);
  const auto last = std::find_if_not(value.rbegin(), std::make_reverse_iterator(first), is_space).base();
  return std::string(first, last);
}

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= text.size(); ++i) {
    if (i == text.size() || text[i] == '\n') {
      std::string_view line = text.substr(start, i - start);
      if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
      }
      if (i < text.size() || !line.empty()) {
        lines.emplace_back(line);
      }
      start = i + 1U;
    }
  }
  return lines;
}

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields) {
  std::ranges::sort(fields, {}, &std::pair<std::string, std::string>::first);

  std::string payload;
  for (const auto& [key, value] : fields) {
    payload.append(key).push_back('=');
    append_escaped(payload, value);
    payload.push_back('\n');
  }
  return payload;
}

// One field per line. The key ends at the first '='; lines without one and
// empty keys are skipped, and a repeated key keeps its first value.
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload) {
  std::unordered_map<std::string, std::string> parsed;
  while (!payload.empty()) {
    const std::size_t newline = payload.find('\n');
    const std::string_view line = payload.substr(0, newline);
    payload.remove_prefix(newline == std::string_view::npos ? payload.size() : newline + 1U);

    const std::size_t eq = line.find('=');
    if (eq == std::string_view::npos || eq == 0) {
      continue;
    }
    parsed.try_emplace(std::string{line.substr(0, eq)}, unescape(line.substr(eq + 1U)));
  }
  return parsed;
}

std::string to_hex(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2U);
  for (unsigned char c : bytes) {
    out.push_back(kHex[(c >> 4U) & 0x0FU]);
    out.push_back(kHex[c & 0x0FU]);
  }
  return out;
}

std::string from_hex(std::string_view hex) {
  if ((hex.size() % 2U) != 0U) {
    return {};
  }

  std::string out;
  out.reserve(hex.size() / 2U);
  for (std::size_t i = 0; i < hex.size(); i += 2U) {
    const int hi = from_hex_digit(hex[i]);
    const int lo = from_hex_digit(hex[i + 1U]);
    if (hi < 0 || lo < 0) {
      return {};
    }
    out.push_back(static_cast<char>((hi << 4U) | lo));
  }
  return out;
}

bool parse_uint64(std::string_view text, std::uint64_t& out) {
  std::uint64_t value = 0;
  const char* end = text.data() + text.size();
  const auto result = std::from_chars(text.data(), end, value);
  if (result.ec != std::errc() || result.ptr != end || text.empty()) {
    return false;
  }
  out = value;
  return true;
}

bool parse_int64(std::string_view text, std::int64_t& out) {
  std::int64_t value = 0;
  const char* end = text.data() + text.size();
  const auto result = std::from_chars(text.data(), end, value);
  if (result.ec != std::errc() || result.ptr != end || text.empty()) {
    return false;
  }
  out = value;
  return true;
}

std::string json_escape(std::string_view value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(value.size() + 8U);
  for (char c : value) {
    switch (c) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\r':
        out.append("\\r");
        break;
      case '\t':
        out.append("\\t");
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20U) {
          out.append("\\u00");
          out.push_back(kHex[(static_cast<unsigned char>(c) >> 4U) & 0x0FU]);
          out.push_back(kHex[static_cast<unsigned char>(c) & 0x0FU]);
        } else {
          out.push_back(c);
        }
        break;
    }
  }
  return out;
}

}  // namespace scanmint::util
