#pragma once

#include "voxcarve/core/types.h"
#include <array>
#include <cstdint>

namespace voxcarve {

// Result of decoding a pick-buffer sample. voxel/face are -1 on "no hit".
struct PickHit {
    std::int32_t voxel;
    std::int32_t face;

    bool isHit() const noexcept { return voxel >= 0 && face >= 0; }
    Face faceEnum() const noexcept { return static_cast<Face>(face); }
};

inline constexpr PickHit kNoHit{-1, -1};

// Packed id: ((index + 1) << 4) | face. Zero is reserved for "no hit".
// Ground cells use the voxel index of their (x, 0, z) cell with Face::Ground.
inline std::uint32_t encodePickId(std::uint32_t index, Face face) noexcept {
    return ((index + 1u) << kPickIndexShift) | (faceId(face) & kPickFaceMask);
}

inline PickHit decodePickId(std::uint32_t packed, std::uint32_t voxelCount) noexcept {
    if (packed == 0) return kNoHit;
    const std::uint32_t face = packed & kPickFaceMask;
    const std::int64_t rawId = static_cast<std::int64_t>(packed >> kPickIndexShift) - 1;
    if (rawId < 0 || rawId >= static_cast<std::int64_t>(voxelCount)) return kNoHit;
    // Field value 7 is never written by the pick builder.
    if (face >= static_cast<std::uint32_t>(kFaceCount)) return kNoHit;
    return PickHit{static_cast<std::int32_t>(rawId), static_cast<std::int32_t>(face)};
}

// Pick target stores the id little-endian in R, G, B.
inline std::uint32_t packedFromColor(std::uint8_t r, std::uint8_t g, std::uint8_t b) noexcept {
    return static_cast<std::uint32_t>(r)
        | (static_cast<std::uint32_t>(g) << 8)
        | (static_cast<std::uint32_t>(b) << 16);
}

inline std::array<std::uint8_t, 3> colorFromPacked(std::uint32_t packed) noexcept {
    return {
        static_cast<std::uint8_t>(packed & 0xFFu),
        static_cast<std::uint8_t>((packed >> 8) & 0xFFu),
        static_cast<std::uint8_t>((packed >> 16) & 0xFFu),
    };
}

inline PickHit decodePickColor(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint32_t voxelCount) noexcept {
    return decodePickId(packedFromColor(r, g, b), voxelCount);
}

} // namespace voxcarve
