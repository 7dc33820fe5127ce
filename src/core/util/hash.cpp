#include "core/util/hash.hpp"

#include <array>

#include <sodium.h>

#include "core/util/canonical.hpp"

namespace lift::util {

bool ensure_sodium_ready() {
  static const bool ready = sodium_init() >= 0;
  return ready;
}

std::string blake2b_hex(std::string_view payload) {
  (void)ensure_sodium_ready();
  std::array<unsigned char, crypto_generichash_BYTES> digest{};
  crypto_generichash(digest.data(), digest.size(), reinterpret_cast<const unsigned char*>(payload.data()),
                     static_cast<unsigned long long>(payload.size()), nullptr, 0);
  return to_hex(std::string_view{reinterpret_cast<const char*>(digest.data()), digest.size()});
}

std::uint64_t stable_hash64(std::string_view payload) {
  (void)ensure_sodium_ready();
  std::array<unsigned char, crypto_generichash_BYTES_MIN> digest{};
  crypto_generichash(digest.data(), digest.size(), reinterpret_cast<const unsigned char*>(payload.data()),
                     static_cast<unsigned long long>(payload.size()), nullptr, 0);

  std::uint64_t value = 0;
  for (std::size_t i = 0; i < 8U; ++i) {
    value |= static_cast<std::uint64_t>(digest[i]) << (i * 8U);
  }
  return value;
}

}  // namespace lift::util
