#ifndef VOXCARVE_MESH_GREEDY_MESHER_H
#define VOXCARVE_MESH_GREEDY_MESHER_H

#include "voxcarve/grid/voxel_grid.h"
#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace voxcarve {

// Merged-quad render buffers. Per vertex: 3 float position, 3 float normal,
// 1 byte material id (0-15). Indices form a 32-bit triangle list.
struct SurfaceMesh {
    std::vector<float> positions;
    std::vector<float> normals;
    std::vector<std::uint8_t> materials;
    std::vector<std::uint32_t> indices;
    std::uint32_t quadCount{0};

    void clear() noexcept {
        positions.clear();
        normals.clear();
        materials.clear();
        indices.clear();
        quadCount = 0;
    }
    std::uint32_t vertexCount() const noexcept {
        return static_cast<std::uint32_t>(positions.size() / kPositionFloatsPerVertex);
    }
    std::uint32_t indexCount() const noexcept { return static_cast<std::uint32_t>(indices.size()); }
};

// Reusable 2-D slice mask. Grows to the largest slice seen and is refilled per
// slice instead of reallocated.
class MeshScratch {
public:
    static constexpr std::int16_t kEmpty = -1;

    std::int16_t* prepare(std::size_t cellCount) {
        if (mask_.size() < cellCount) mask_.resize(cellCount);
        std::fill(mask_.begin(), mask_.begin() + static_cast<std::ptrdiff_t>(cellCount), kEmpty);
        return mask_.data();
    }
    std::size_t capacity() const noexcept { return mask_.size(); }

private:
    std::vector<std::int16_t> mask_;
};

// Inclusion predicate P(index). Must already imply solidity.
using VoxelPredicateFn = bool(*)(const void* ctx, const VoxelGrid& grid, std::uint32_t index);

// Greedy surface extraction of the P-selected voxels: one maximal
// same-material rectangle per run, outward wound, offset by kFaceEpsilon
// along the face normal. `out` is cleared first.
void buildGreedyMesh(
    const VoxelGrid& grid,
    VoxelPredicateFn include,
    const void* ctx,
    MeshScratch& scratch,
    SurfaceMesh& out
);

// Solid voxels outside every region.
void buildMainMesh(const VoxelGrid& grid, MeshScratch& scratch, SurfaceMesh& out);

// Solid voxels inside `region`. Other regions are ignored, so overlapping
// regions each get the shared voxels.
void buildRegionMesh(const VoxelGrid& grid, const Region& region, MeshScratch& scratch, SurfaceMesh& out);

// Solid voxels inside the named region. Returns false (and an empty mesh) when
// no region has that name.
bool buildRegionMesh(const VoxelGrid& grid, const std::string& regionName, MeshScratch& scratch, SurfaceMesh& out);

} // namespace voxcarve

#endif // VOXCARVE_MESH_GREEDY_MESHER_H
