#pragma once

#include "voxcarve/core/types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace voxcarve {

// Before/after state of one voxel touched by an action.
struct VoxelDiff {
    std::uint32_t index;
    bool fromSolid;
    std::uint8_t fromMaterial;
    bool toSolid;
    std::uint8_t toMaterial;
};

struct PaletteDiff {
    std::uint32_t slot;
    RgbColor from;
    RgbColor to;
};

// A region box moved by an action. Undo only restores the box when the
// region still has the box the action left it with.
struct RegionMove {
    std::string name;
    Vec3i fromMin;
    Vec3i fromMax;
    Vec3i toMin;
    Vec3i toMax;
};

enum class HistoryActionKind : std::uint8_t { Voxels = 0, Palette = 1 };

// A single entry in the undo/redo stack. Diffs replay in recorded order on
// redo and reverse order on undo.
struct HistoryAction {
    HistoryActionKind kind = HistoryActionKind::Voxels;
    std::string label;
    std::vector<VoxelDiff> voxels;
    std::vector<PaletteDiff> palette;
    // Regions carried along by a shift, in the order they moved.
    std::vector<RegionMove> regions;

    bool empty() const noexcept {
        return voxels.empty() && palette.empty() && regions.empty();
    }
};

} // namespace voxcarve
