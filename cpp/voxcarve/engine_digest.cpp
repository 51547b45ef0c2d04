// Document digest for CarveEngine. Covers everything the host can observe
// through the command stream: chunk dimensions, voxel state, regions, palette.

#include "voxcarve/engine.h"
#include "voxcarve/core/digest.h"

using voxcarve::kDigestOffset;
using voxcarve::hashF32;
using voxcarve::hashBytes;

// voxcarve::hashU32 is spelled out: CarveEngine::hashU32 is the 32-bit ABI hash.
CarveEngine::DocumentDigest CarveEngine::getDocumentDigest() const noexcept {
    std::uint64_t h = kDigestOffset;

    h = voxcarve::hashU32(h, 0x4C584F56u); // "VOXL" marker
    h = voxcarve::hashU32(h, kProtocolVersion);

    h = voxcarve::hashU32(h, static_cast<std::uint32_t>(grid_.sizeX()));
    h = voxcarve::hashU32(h, static_cast<std::uint32_t>(grid_.sizeY()));
    h = voxcarve::hashU32(h, static_cast<std::uint32_t>(grid_.sizeZ()));

    const std::uint32_t count = grid_.voxelCount();
    for (std::uint32_t i = 0; i < count; ++i) {
        const std::uint32_t packed = (grid_.isSolid(i) ? 0x10u : 0u) | grid_.material(i);
        h = voxcarve::hashU32(h, packed);
    }

    const auto& regions = grid_.regions().regions();
    h = voxcarve::hashU32(h, static_cast<std::uint32_t>(regions.size()));
    for (const auto& region : regions) {
        const std::string& name = region.name();
        h = voxcarve::hashU32(h, static_cast<std::uint32_t>(name.size()));
        if (!name.empty()) {
            h = hashBytes(h, reinterpret_cast<const std::uint8_t*>(name.data()), name.size());
        }
        for (int axis = 0; axis < 3; ++axis) {
            h = voxcarve::hashU32(h, static_cast<std::uint32_t>(region.min()[axis]));
            h = voxcarve::hashU32(h, static_cast<std::uint32_t>(region.max()[axis]));
        }
    }

    for (std::uint32_t slot = 0; slot < static_cast<std::uint32_t>(voxcarve::kMaterialCount); ++slot) {
        const RgbColor& c = palette_.color(slot);
        h = hashF32(h, c.r);
        h = hashF32(h, c.g);
        h = hashF32(h, c.b);
    }

    return DocumentDigest{
        static_cast<std::uint32_t>(h & 0xFFFFFFFFu),
        static_cast<std::uint32_t>((h >> 32) & 0xFFFFFFFFu)
    };
}
