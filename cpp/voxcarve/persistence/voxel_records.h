#pragma once

#include "voxcarve/grid/voxel_grid.h"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace voxcarve {

// Solid voxel record as exchanged with the host's scene files.
//   short form "xyzm":    one hex digit per field, grids with every dim <= 16
//   wide form  "xxyyzzm": two hex digits per coordinate, one for material
// Absent records are non-solid with material 0.
struct VoxelRecord {
    int x;
    int y;
    int z;
    std::uint8_t material;
};

inline bool usesShortRecords(const VoxelGrid& grid) noexcept {
    return grid.sizeX() <= 16 && grid.sizeY() <= 16 && grid.sizeZ() <= 16;
}

std::string encodeVoxelRecord(const VoxelRecord& record, bool shortForm);

// Accepts either form (by length) and either hex case.
bool decodeVoxelRecord(std::string_view text, VoxelRecord& out);

// Solid voxels in z, y, x order.
std::vector<std::string> exportVoxelRecords(const VoxelGrid& grid);

// Clears the grid (non-solid, material 0) then applies every decodable,
// in-bounds record. Returns the number of records applied.
std::uint32_t importVoxelRecords(VoxelGrid& grid, const std::vector<std::string>& records);

} // namespace voxcarve
