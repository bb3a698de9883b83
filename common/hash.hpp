#pragma once

// ============================================================
// hash.hpp -- xxHash3 wrappers for request fingerprints
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <array>
#include <string>

// XXH_STATIC_LINKING_ONLY exposes the XXH3 API of the installed xxhash
#define XXH_STATIC_LINKING_ONLY
#include "xxhash.h"

namespace hash {

// 16-byte (128-bit) hash result
using Hash128 = std::array<u8, 16>;

// Compute xxh3_128 of a memory buffer
inline Hash128 xxh3_128(const void* data, size_t len) {
    XXH128_hash_t h = XXH3_128bits(data, len);
    Hash128 result;
    // Store as big-endian for determinism
    u64 lo = h.low64;
    u64 hi = h.high64;
    for (int i = 0; i < 8; ++i) {
        result[(size_t)i]     = (u8)(hi >> (56 - 8 * i));
        result[(size_t)i + 8] = (u8)(lo >> (56 - 8 * i));
    }
    return result;
}

inline std::string to_hex(const Hash128& h) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(32);
    for (u8 b : h) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

// 32 lowercase hex characters identifying the given text
inline std::string fingerprint(const std::string& text) {
    return to_hex(xxh3_128(text.data(), text.size()));
}

} // namespace hash
