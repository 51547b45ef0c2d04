#pragma once

#include "voxcarve/core/types.h"
#include <array>
#include <cstdint>

namespace voxcarve {

// The 16 material colors. Owned here only so palette edits can be recorded and
// restored by the edit history; the host owns everything else about colors.
class PaletteSlots {
public:
    PaletteSlots() { reset(); }

    void reset() noexcept {
        static constexpr std::uint32_t kDefaultRgb[kMaterialCount] = {
            0xe76f51, 0xf4a261, 0xe9c46a, 0x2a9d8f,
            0x264653, 0xa8dadc, 0x457b9d, 0x1d3557,
            0xff6b6b, 0xffd93d, 0x6bcb77, 0x4d96ff,
            0xb983ff, 0xff4d6d, 0x9ef01a, 0x00f5d4,
        };
        for (int i = 0; i < kMaterialCount; ++i) {
            const std::uint32_t rgb = kDefaultRgb[i];
            colors_[i] = RgbColor{
                static_cast<float>((rgb >> 16) & 0xFF) / 255.0f,
                static_cast<float>((rgb >> 8) & 0xFF) / 255.0f,
                static_cast<float>(rgb & 0xFF) / 255.0f,
            };
        }
    }

    static bool validSlot(std::uint32_t slot) noexcept { return slot < static_cast<std::uint32_t>(kMaterialCount); }

    const RgbColor& color(std::uint32_t slot) const noexcept { return colors_[slot]; }
    void setColor(std::uint32_t slot, const RgbColor& c) noexcept { colors_[slot] = c; }

    // Flat r,g,b x 16 view for uniform upload.
    const float* data() const noexcept { return &colors_[0].r; }

private:
    std::array<RgbColor, kMaterialCount> colors_{};
};

static_assert(sizeof(RgbColor) == 3 * sizeof(float), "palette slots must stay tightly packed");

} // namespace voxcarve
