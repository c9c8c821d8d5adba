#include "core/util/hash.hpp"

#include <stdexcept>

#include <sodium.h>

#include "core/util/canonical.hpp"

namespace scanmint::util {

static_assert(crypto_hash_sha256_BYTES == kDigestBytes, "digest width must match SHA-256");

bool ensure_crypto_ready() {
  // sodium_init returns 1 when the library was already initialized.
  static const bool ready = sodium_init() >= 0;
  return ready;
}

Digest sha256_digest(std::string_view payload) {
  if (!ensure_crypto_ready()) {
    throw std::runtime_error("libsodium initialization failed.");
  }
  Digest digest{};
  crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char*>(payload.data()),
                     static_cast<unsigned long long>(payload.size()));
  return digest;
}

std::string sha256_hex(std::string_view payload) {
  return digest_to_hex(sha256_digest(payload));
}

std::string digest_to_hex(const Digest& digest) {
  return to_hex(std::string_view{reinterpret_cast<const char*>(digest.data()), digest.size()});
}

bool digest_from_hex(std::string_view hex, Digest& out) {
  if (hex.size() >= 2U && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    hex.remove_prefix(2U);
  }
  if (hex.size() != kDigestBytes * 2U) {
    return false;
  }

  const std::string raw = from_hex(hex);
  if (raw.size() != kDigestBytes) {
    return false;
  }
  for (std::size_t i = 0; i < kDigestBytes; ++i) {
    out[i] = static_cast<unsigned char>(raw[i]);
  }
  return true;
}

}  // namespace scanmint::util
