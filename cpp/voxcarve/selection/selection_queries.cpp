#include "voxcarve/selection/selection_queries.h"
#include "voxcarve/grid/face_exposure.h"

#include <unordered_set>

namespace voxcarve {

std::vector<std::uint32_t> rowVoxels(const VoxelGrid& grid, std::uint32_t voxel, Face face, bool wantSolid) {
    std::vector<std::uint32_t> out;
    if (voxel >= grid.voxelCount()) return out;

    const FaceInfo& info = faceInfo(face);
    const Vec3i hit = grid.coordsOf(voxel);
    const int extent = grid.size(info.axis);
    out.reserve(static_cast<std::size_t>(extent));

    Vec3i c = hit;
    for (int t = 0; t < extent; ++t) {
        c[info.axis] = t;
        if (!grid.within(c)) continue;
        const std::uint32_t index = grid.idx3(c);
        if (grid.isSolid(index) != wantSolid) continue;
        out.push_back(index);
    }
    return out;
}

std::vector<std::uint32_t> planeSurfaceVoxels(const VoxelGrid& grid, std::uint32_t voxel, Face face) {
    std::vector<std::uint32_t> out;
    if (voxel >= grid.voxelCount()) return out;

    const FaceInfo& info = faceInfo(face);
    const Vec3i hit = grid.coordsOf(voxel);

    Vec3i c{0, 0, 0};
    c[info.axis] = hit[info.axis];
    for (int a = 0; a < grid.size(info.u); ++a) {
        for (int b = 0; b < grid.size(info.v); ++b) {
            c[info.u] = a;
            c[info.v] = b;
            if (!grid.within(c)) continue;
            const std::uint32_t index = grid.idx3(c);
            if (!grid.isSolid(index)) continue;
            if (face != Face::Ground && !faceExposed(grid, c.x, c.y, c.z, face)) continue;
            out.push_back(index);
        }
    }
    return out;
}

std::vector<std::uint32_t> groundPlaneVoxels(const VoxelGrid& grid) {
    std::vector<std::uint32_t> out;
    out.reserve(static_cast<std::size_t>(grid.sizeX()) * grid.sizeZ());
    for (int x = 0; x < grid.sizeX(); ++x) {
        for (int z = 0; z < grid.sizeZ(); ++z) {
            out.push_back(grid.idx3(x, 0, z));
        }
    }
    return out;
}

std::vector<std::uint32_t> planeAddTargets(const VoxelGrid& grid, std::uint32_t voxel, Face face) {
    std::vector<std::uint32_t> out;
    if (voxel >= grid.voxelCount()) return out;

    const std::vector<std::uint32_t> surface = face == Face::Ground
        ? groundPlaneVoxels(grid)
        : planeSurfaceVoxels(grid, voxel, face);
    const Vec3i& d = faceInfo(face).dir;

    std::unordered_set<std::uint32_t> seen;
    seen.reserve(surface.size());
    for (const std::uint32_t s : surface) {
        const Vec3i c = grid.coordsOf(s);
        const Vec3i n{c.x + d.x, c.y + d.y, c.z + d.z};
        if (!grid.within(n)) continue;
        const std::uint32_t target = grid.idx3(n);
        if (grid.isSolid(target)) continue;
        if (seen.insert(target).second) out.push_back(target);
    }
    return out;
}

} // namespace voxcarve
