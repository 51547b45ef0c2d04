#pragma once

#include "voxcarve/grid/voxel_grid.h"
#include <cstdint>
#include <vector>

namespace voxcarve {

// Unmerged pick quads. Per vertex: 3 float position, 1 uint32 packed id.
struct PickMesh {
    std::vector<float> positions;
    std::vector<std::uint32_t> packedIds;
    std::vector<std::uint32_t> indices;

    void clear() noexcept {
        positions.clear();
        packedIds.clear();
        indices.clear();
    }
    std::uint32_t vertexCount() const noexcept { return static_cast<std::uint32_t>(packedIds.size()); }
    std::uint32_t indexCount() const noexcept { return static_cast<std::uint32_t>(indices.size()); }
    std::uint32_t quadCount() const noexcept { return vertexCount() / 4u; }
};

// Voxel faces are always drawn in the pick pass; the ground plane only when
// the host is in add mode.
struct PickGeometry {
    PickMesh voxelFaces;
    PickMesh ground;

    void clear() noexcept {
        voxelFaces.clear();
        ground.clear();
    }
};

// One quad per exposed voxel face plus one per ground cell (y = 0 plane).
// Drawn with culling disabled, so all quads share one winding.
void buildPickFaces(const VoxelGrid& grid, PickGeometry& out);

} // namespace voxcarve
