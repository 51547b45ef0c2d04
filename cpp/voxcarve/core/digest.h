#pragma once

#include <cstdint>
#include <cstring>
#include <cmath>
#include <cstddef>

namespace voxcarve {

// =============================================================================
// Hash/Digest (FNV-1a)
// =============================================================================

constexpr std::uint64_t kDigestOffset = 14695981039346656037ull;
constexpr std::uint64_t kDigestPrime = 1099511628211ull;

inline std::uint64_t hashU32(std::uint64_t h, std::uint32_t v) {
    h ^= v;
    return h * kDigestPrime;
}

inline std::uint64_t hashBytes(std::uint64_t h, const std::uint8_t* data, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
        h ^= data[i];
        h *= kDigestPrime;
    }
    return h;
}

inline std::uint32_t canonicalizeF32(float v) {
    if (std::isnan(v)) return 0x7fc00000u;
    if (v == 0.0f) return 0u;
    std::uint32_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

inline std::uint64_t hashF32(std::uint64_t h, float v) {
    return hashU32(h, canonicalizeF32(v));
}

} // namespace voxcarve
