#include "voxcarve/tools/edit_tools.h"
#include "voxcarve/selection/selection_queries.h"

#include <algorithm>
#include <utility>

namespace voxcarve {

namespace {

const char* modeVerb(ToolMode mode) {
    switch (mode) {
        case ToolMode::Paint: return "Paint";
        case ToolMode::Add: return "Add";
        case ToolMode::Carve: return "Remove";
    }
    return "Edit";
}

const char* optionNoun(ToolOption option) {
    switch (option) {
        case ToolOption::Voxel: return "voxel";
        case ToolOption::Row: return "row";
        case ToolOption::Plane: return "plane";
    }
    return "voxel";
}

std::vector<std::uint32_t> surfaceTargets(const VoxelGrid& grid, ToolOption option, std::uint32_t voxel, Face face) {
    switch (option) {
        case ToolOption::Voxel:
            if (grid.isSolid(voxel)) return {voxel};
            return {};
        case ToolOption::Row:
            return rowSurfaceVoxels(grid, voxel, face);
        case ToolOption::Plane:
            return planeSurfaceVoxels(grid, voxel, face);
    }
    return {};
}

std::vector<std::uint32_t> addTargets(const VoxelGrid& grid, ToolOption option, std::uint32_t voxel, Face face) {
    switch (option) {
        case ToolOption::Voxel: {
            const Vec3i c = grid.coordsOf(voxel);
            const Vec3i& d = faceInfo(face).dir;
            const Vec3i n{c.x + d.x, c.y + d.y, c.z + d.z};
            if (!grid.within(n)) return {};
            const std::uint32_t target = grid.idx3(n);
            if (grid.isSolid(target)) return {};
            return {target};
        }
        case ToolOption::Row:
            return rowAddTargets(grid, voxel, face);
        case ToolOption::Plane:
            return planeAddTargets(grid, voxel, face);
    }
    return {};
}

} // namespace

std::string toolLabel(ToolMode mode, ToolOption option) {
    std::string label(modeVerb(mode));
    label += ' ';
    label += optionNoun(option);
    return label;
}

std::vector<std::uint32_t> toolTargets(const VoxelGrid& grid, ToolMode mode, ToolOption option, const PickHit& hit) {
    if (!hit.isHit() || hit.face >= kFaceCount) return {};
    const std::uint32_t voxel = static_cast<std::uint32_t>(hit.voxel);
    if (voxel >= grid.voxelCount()) return {};
    const Face face = hit.faceEnum();
    if (mode == ToolMode::Add) return addTargets(grid, option, voxel, face);
    return surfaceTargets(grid, option, voxel, face);
}

std::uint32_t recordTool(
    HistoryManager& history,
    HistoryAction& action,
    const VoxelGrid& grid,
    ToolMode mode,
    ToolOption option,
    const PickHit& hit,
    std::uint8_t brush
) {
    const std::vector<std::uint32_t> targets = toolTargets(grid, mode, option, hit);
    std::uint32_t changed = 0;
    for (const std::uint32_t index : targets) {
        bool ok = false;
        switch (mode) {
            case ToolMode::Paint:
            case ToolMode::Add:
                ok = history.recordChange(action, index, true, brush);
                break;
            case ToolMode::Carve:
                ok = history.recordChange(action, index, false, grid.material(index));
                break;
        }
        if (ok) ++changed;
    }
    return changed;
}

bool applyTool(HistoryManager& history, const VoxelGrid& grid, ToolMode mode, ToolOption option, const PickHit& hit, std::uint8_t brush) {
    HistoryAction action = history.beginAction(toolLabel(mode, option));
    recordTool(history, action, grid, mode, option, hit, brush);
    return history.commit(std::move(action));
}

std::string shiftLabel(const Vec3i& offset) {
    if (offset.x != 0) return offset.x > 0 ? "Shift +X" : "Shift -X";
    if (offset.y != 0) return offset.y > 0 ? "Shift +Y" : "Shift -Y";
    return offset.z > 0 ? "Shift +Z" : "Shift -Z";
}

Vec3i clampShift(const VoxelGrid& grid, const Vec3i& offset) {
    Vec3i out{0, 0, 0};
    for (int axis = 0; axis < 3; ++axis) {
        const int extent = grid.size(axis);
        out[axis] = std::max(-extent, std::min(extent, offset[axis]));
    }
    return out;
}

void recordShift(HistoryManager& history, HistoryAction& action, VoxelGrid& grid, const Vec3i& requested) {
    const Vec3i offset = clampShift(grid, requested);
    if (offset == Vec3i{0, 0, 0}) return;

    // Target state first; the grid is mutated while recording.
    const std::uint32_t count = grid.voxelCount();
    std::vector<std::uint8_t> nextSolid(count, 0);
    std::vector<std::uint8_t> nextMaterial(count, 0);
    for (int z = 0; z < grid.sizeZ(); ++z) {
        for (int y = 0; y < grid.sizeY(); ++y) {
            for (int x = 0; x < grid.sizeX(); ++x) {
                const std::uint32_t from = grid.idx3(x, y, z);
                if (!grid.isSolid(from)) continue;
                const Vec3i to{x + offset.x, y + offset.y, z + offset.z};
                if (!grid.within(to)) continue;
                const std::uint32_t target = grid.idx3(to);
                nextSolid[target] = 1;
                nextMaterial[target] = grid.material(from);
            }
        }
    }

    for (std::uint32_t i = 0; i < count; ++i) {
        history.recordChange(action, i, nextSolid[i] != 0, nextMaterial[i]);
    }

    if (grid.regions().empty()) return;
    const std::size_t first = action.regions.size();
    for (const auto& region : grid.regions().regions()) {
        action.regions.push_back(RegionMove{region.name(), region.min(), region.max(), region.min(), region.max()});
    }
    grid.regions().translate(grid, offset);
    for (std::size_t i = first; i < action.regions.size(); ++i) {
        RegionMove& move = action.regions[i];
        const Region* region = grid.regions().find(move.name);
        if (!region) continue;
        move.toMin = region->min();
        move.toMax = region->max();
    }
}

bool shiftVoxels(HistoryManager& history, VoxelGrid& grid, const Vec3i& offset) {
    HistoryAction action = history.beginAction(shiftLabel(offset));
    recordShift(history, action, grid, offset);
    return history.commit(std::move(action));
}

} // namespace voxcarve
