#ifndef VOXCARVE_GRID_VOXEL_GRID_H
#define VOXCARVE_GRID_VOXEL_GRID_H

#include "voxcarve/core/types.h"
#include "voxcarve/grid/region_store.h"
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace voxcarve {

enum class MaterialSeedMode : std::uint32_t {
    Bands = 0,
    Random = 1,
};

// True when a grid of these dimensions can be allocated and picked.
inline bool supportedGridSize(std::uint32_t sizeX, std::uint32_t sizeY, std::uint32_t sizeZ) noexcept {
    if (sizeX == 0 || sizeY == 0 || sizeZ == 0) return false;
    if (sizeX > kMaxGridEdge || sizeY > kMaxGridEdge || sizeZ > kMaxGridEdge) return false;
    const std::uint64_t cells = static_cast<std::uint64_t>(sizeX) * sizeY * sizeZ;
    return cells <= kMaxGridVoxels;
}

// Dense solid/material storage for one chunk.
//
// Index layout: idx3(x, y, z) = x + sizeX * (y + sizeY * z).
// Accessors do not bounds-check; callers guard coordinates with within().
// Material survives carving: clearing solidity leaves the material slot as is.
class VoxelGrid {
public:
    VoxelGrid();
    VoxelGrid(int sizeX, int sizeY, int sizeZ);

    int sizeX() const noexcept { return sizeX_; }
    int sizeY() const noexcept { return sizeY_; }
    int sizeZ() const noexcept { return sizeZ_; }
    int size(int axis) const noexcept { return axis == 0 ? sizeX_ : (axis == 1 ? sizeY_ : sizeZ_); }
    Vec3i dims() const noexcept { return Vec3i{sizeX_, sizeY_, sizeZ_}; }
    std::uint32_t voxelCount() const noexcept { return static_cast<std::uint32_t>(solid_.size()); }

    std::uint32_t idx3(int x, int y, int z) const noexcept {
        return static_cast<std::uint32_t>(x + sizeX_ * (y + sizeY_ * z));
    }
    std::uint32_t idx3(const Vec3i& c) const noexcept { return idx3(c.x, c.y, c.z); }

    Vec3i coordsOf(std::uint32_t index) const noexcept {
        const std::uint32_t plane = static_cast<std::uint32_t>(sizeX_) * static_cast<std::uint32_t>(sizeY_);
        const std::uint32_t z = index / plane;
        const std::uint32_t rem = index - z * plane;
        const std::uint32_t y = rem / static_cast<std::uint32_t>(sizeX_);
        const std::uint32_t x = rem - y * static_cast<std::uint32_t>(sizeX_);
        return Vec3i{static_cast<int>(x), static_cast<int>(y), static_cast<int>(z)};
    }

    bool within(int x, int y, int z) const noexcept {
        return x >= 0 && y >= 0 && z >= 0 && x < sizeX_ && y < sizeY_ && z < sizeZ_;
    }
    bool within(const Vec3i& c) const noexcept { return within(c.x, c.y, c.z); }

    bool isSolid(std::uint32_t index) const noexcept { return solid_[index] != 0; }
    void setSolid(std::uint32_t index, bool value) noexcept { solid_[index] = value ? 1 : 0; }

    std::uint8_t material(std::uint32_t index) const noexcept { return material_[index]; }
    void setMaterial(std::uint32_t index, std::uint8_t value) noexcept { material_[index] = value & kMaterialMask; }

    void fill(bool solid);
    void fillMaterial(std::uint8_t value);
    void seedMaterials(MaterialSeedMode mode, std::uint32_t seed = 0);

    // Preserves overlapping coordinates; new cells are non-solid with
    // material 0. Regions are dropped because their masks no longer match.
    void resize(int newSizeX, int newSizeY, int newSizeZ);
    // Back to the default 16^3 all-solid chunk.
    void resetSize();

    std::uint32_t solidCount() const noexcept;

    // Regions
    const Region& addRegion(const std::string& name, const Vec3i& min, const Vec3i& max) {
        return regions_.add(*this, name, min, max);
    }
    void clearRegions() noexcept { regions_.clear(); }
    const RegionStore& regions() const noexcept { return regions_; }
    RegionStore& regions() noexcept { return regions_; }

private:
    int sizeX_;
    int sizeY_;
    int sizeZ_;
    std::vector<std::uint8_t> solid_;
    std::vector<std::uint8_t> material_;
    RegionStore regions_;
};

} // namespace voxcarve

#endif // VOXCARVE_GRID_VOXEL_GRID_H
