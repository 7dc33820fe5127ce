#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace lift::util {

// Returns false when libsodium could not be initialised.
bool ensure_sodium_ready();

// Unkeyed BLAKE2b-256 digest, lowercase hex.
std::string blake2b_hex(std::string_view payload);

// First 8 digest bytes as a little-endian integer. Identical on every host.
std::uint64_t stable_hash64(std::string_view payload);

}  // namespace lift::util
