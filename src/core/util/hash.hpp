#pragma once

#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace scanmint::util {

// Must succeed once before any digest is computed; safe to call repeatedly.
bool ensure_crypto_ready();

Digest sha256_digest(std::string_view payload);
std::string sha256_hex(std::string_view payload);

std::string digest_to_hex(const Digest& digest);
bool digest_from_hex(std::string_view hex, Digest& out);

}  // namespace scanmint::util
