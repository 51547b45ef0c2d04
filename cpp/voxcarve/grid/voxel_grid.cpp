#include "voxcarve/grid/voxel_grid.h"
#include "voxcarve/core/logging.h"

#include <algorithm>
#include <random>

namespace voxcarve {

VoxelGrid::VoxelGrid() : VoxelGrid(kDefaultGridSize, kDefaultGridSize, kDefaultGridSize) {}

VoxelGrid::VoxelGrid(int sizeX, int sizeY, int sizeZ)
    : sizeX_(sizeX),
      sizeY_(sizeY),
      sizeZ_(sizeZ),
      solid_(static_cast<std::size_t>(sizeX) * sizeY * sizeZ, 1),
      material_(static_cast<std::size_t>(sizeX) * sizeY * sizeZ, 0) {}

void VoxelGrid::fill(bool solid) {
    std::fill(solid_.begin(), solid_.end(), solid ? 1 : 0);
}

void VoxelGrid::fillMaterial(std::uint8_t value) {
    std::fill(material_.begin(), material_.end(), static_cast<std::uint8_t>(value & kMaterialMask));
}

void VoxelGrid::seedMaterials(MaterialSeedMode mode, std::uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, kMaterialCount - 1);
    for (int z = 0; z < sizeZ_; ++z) {
        for (int y = 0; y < sizeY_; ++y) {
            for (int x = 0; x < sizeX_; ++x) {
                const int m = mode == MaterialSeedMode::Random
                    ? dist(rng)
                    : ((x >> 2) + (y >> 2) + (z >> 2)) % kMaterialCount;
                setMaterial(idx3(x, y, z), static_cast<std::uint8_t>(m));
            }
        }
    }
}

void VoxelGrid::resize(int newSizeX, int newSizeY, int newSizeZ) {
    const std::size_t newLength = static_cast<std::size_t>(newSizeX) * newSizeY * newSizeZ;
    std::vector<std::uint8_t> newSolid(newLength, 0);
    std::vector<std::uint8_t> newMaterial(newLength, 0);

    const int copyX = std::min(sizeX_, newSizeX);
    const int copyY = std::min(sizeY_, newSizeY);
    const int copyZ = std::min(sizeZ_, newSizeZ);
    for (int z = 0; z < copyZ; ++z) {
        for (int y = 0; y < copyY; ++y) {
            for (int x = 0; x < copyX; ++x) {
                const std::size_t oldIdx = static_cast<std::size_t>(x + sizeX_ * (y + sizeY_ * z));
                const std::size_t newIdx = static_cast<std::size_t>(x + newSizeX * (y + newSizeY * z));
                newSolid[newIdx] = solid_[oldIdx];
                newMaterial[newIdx] = material_[oldIdx];
            }
        }
    }

    VOXCARVE_LOG_DEBUG("resize %dx%dx%d -> %dx%dx%d", sizeX_, sizeY_, sizeZ_, newSizeX, newSizeY, newSizeZ);

    sizeX_ = newSizeX;
    sizeY_ = newSizeY;
    sizeZ_ = newSizeZ;
    solid_ = std::move(newSolid);
    material_ = std::move(newMaterial);
    regions_.clear();
}

void VoxelGrid::resetSize() {
    sizeX_ = kDefaultGridSize;
    sizeY_ = kDefaultGridSize;
    sizeZ_ = kDefaultGridSize;
    const std::size_t length = static_cast<std::size_t>(kDefaultGridSize) * kDefaultGridSize * kDefaultGridSize;
    solid_.assign(length, 1);
    material_.assign(length, 0);
    regions_.clear();
}

std::uint32_t VoxelGrid::solidCount() const noexcept {
    return static_cast<std::uint32_t>(std::count(solid_.begin(), solid_.end(), static_cast<std::uint8_t>(1)));
}

} // namespace voxcarve
