#pragma once

#include "voxcarve/history/history_manager.h"
#include "voxcarve/pick/pick_codec.h"
#include "voxcarve/grid/voxel_grid.h"
#include <cstdint>
#include <string>
#include <vector>

namespace voxcarve {

enum class ToolMode : std::uint32_t {
    Paint = 0,
    Add = 1,
    Carve = 2,
};

enum class ToolOption : std::uint32_t {
    Voxel = 0,
    Row = 1,
    Plane = 2,
};

inline bool validToolMode(std::uint32_t v) noexcept { return v <= static_cast<std::uint32_t>(ToolMode::Carve); }
inline bool validToolOption(std::uint32_t v) noexcept { return v <= static_cast<std::uint32_t>(ToolOption::Plane); }

// History label, e.g. "Paint voxel", "Add plane", "Remove row".
std::string toolLabel(ToolMode mode, ToolOption option);

// Cells the tool would touch for this hit, without mutating anything.
// Empty for "no hit".
std::vector<std::uint32_t> toolTargets(const VoxelGrid& grid, ToolMode mode, ToolOption option, const PickHit& hit);

// Records the tool's changes into an already open action. Returns the number
// of voxels that actually changed.
std::uint32_t recordTool(
    HistoryManager& history,
    HistoryAction& action,
    const VoxelGrid& grid,
    ToolMode mode,
    ToolOption option,
    const PickHit& hit,
    std::uint8_t brush
);

// One tool application as its own history action. Returns true when
// something changed (and an action was committed).
bool applyTool(HistoryManager& history, const VoxelGrid& grid, ToolMode mode, ToolOption option, const PickHit& hit, std::uint8_t brush);

// "Shift +X" style label. The first non-zero component names the axis.
std::string shiftLabel(const Vec3i& offset);

// Each component limited to [-extent, extent] of its axis; anything larger
// would empty the grid just the same.
Vec3i clampShift(const VoxelGrid& grid, const Vec3i& offset);

// Moves every solid voxel by `offset` (clamped) into an open action. Voxels
// leaving the grid are dropped; vacated cells end non-solid with material 0.
// Region boxes move with the voxels and are restored on undo.
void recordShift(HistoryManager& history, HistoryAction& action, VoxelGrid& grid, const Vec3i& offset);

bool shiftVoxels(HistoryManager& history, VoxelGrid& grid, const Vec3i& offset);

} // namespace voxcarve
