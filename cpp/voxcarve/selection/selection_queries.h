#pragma once

#include "voxcarve/core/types.h"
#include "voxcarve/grid/voxel_grid.h"
#include <cstdint>
#include <vector>

namespace voxcarve {

// Line and plane candidate sets for the row/plane tools. `voxel` is a resolved
// pick index; an index outside the grid yields an empty set.

// Every in-bounds cell on the line through `voxel` along the face's sweep axis
// whose solidity equals `wantSolid`. Gaps do not stop the sweep.
std::vector<std::uint32_t> rowVoxels(const VoxelGrid& grid, std::uint32_t voxel, Face face, bool wantSolid);

inline std::vector<std::uint32_t> rowSurfaceVoxels(const VoxelGrid& grid, std::uint32_t voxel, Face face) {
    return rowVoxels(grid, voxel, face, true);
}

inline std::vector<std::uint32_t> rowAddTargets(const VoxelGrid& grid, std::uint32_t voxel, Face face) {
    return rowVoxels(grid, voxel, face, false);
}

// Solid cells in the plane through `voxel` normal to the face axis that are
// exposed on that face. For Face::Ground: solid cells of that plane.
std::vector<std::uint32_t> planeSurfaceVoxels(const VoxelGrid& grid, std::uint32_t voxel, Face face);

// Every cell of the y = 0 layer.
std::vector<std::uint32_t> groundPlaneVoxels(const VoxelGrid& grid);

// Surface set (ground layer for Face::Ground) stepped once along the face
// normal, keeping in-bounds non-solid cells, first occurrence order.
std::vector<std::uint32_t> planeAddTargets(const VoxelGrid& grid, std::uint32_t voxel, Face face);

} // namespace voxcarve
