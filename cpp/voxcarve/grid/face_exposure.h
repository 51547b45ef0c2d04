#pragma once

#include "voxcarve/core/types.h"
#include "voxcarve/grid/voxel_grid.h"
#include <cstdint>

namespace voxcarve {

// True iff (x,y,z) is solid and its neighbor across `face` is out of bounds
// or not solid. Chunk-boundary faces of solid voxels are always exposed.
// The caller guarantees (x,y,z) is within the grid. Ground has no neighbor
// and is never exposed.
bool faceExposed(const VoxelGrid& grid, int x, int y, int z, Face face) noexcept;

// Sum of exposed cardinal faces over every voxel of the grid.
std::uint32_t exposedFaceCount(const VoxelGrid& grid) noexcept;

} // namespace voxcarve
