#pragma once

#include "voxcarve/core/types.h"
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace voxcarve {

class VoxelGrid;

// Named axis-aligned box over the grid. Membership is geometric: every cell
// inside the inclusive box counts, solid or not. The mask is sized to the grid
// dimensions at construction time.
class Region {
public:
    Region(const VoxelGrid& grid, std::string name, const Vec3i& min, const Vec3i& max);

    const std::string& name() const noexcept { return name_; }
    const Vec3i& min() const noexcept { return min_; }
    const Vec3i& max() const noexcept { return max_; }
    std::uint32_t cellCount() const noexcept { return cellCount_; }

    bool contains(std::uint32_t index) const noexcept {
        return index < mask_.size() && mask_[index] != 0;
    }

private:
    std::string name_;
    Vec3i min_;
    Vec3i max_;
    std::uint32_t cellCount_{0};
    std::vector<std::uint8_t> mask_;
};

// Ordered collection of regions, keyed by unique name. Overlap between
// regions is not prevented.
class RegionStore {
public:
    // Adds or replaces (same position) the region called `name`.
    const Region& add(const VoxelGrid& grid, const std::string& name, const Vec3i& min, const Vec3i& max);
    bool remove(const std::string& name);
    void clear() noexcept { regions_.clear(); }

    const Region* find(const std::string& name) const noexcept;
    bool anyContains(std::uint32_t index) const noexcept;

    // Replaces the box of an existing region; false when no region has that name.
    bool reshape(const VoxelGrid& grid, const std::string& name, const Vec3i& min, const Vec3i& max);

    // Re-derive every mask after the boxes moved by `offset`. Bounds saturate
    // at the int range.
    void translate(const VoxelGrid& grid, const Vec3i& offset);

    const std::vector<Region>& regions() const noexcept { return regions_; }
    std::size_t size() const noexcept { return regions_.size(); }
    bool empty() const noexcept { return regions_.empty(); }

private:
    std::vector<Region> regions_;
};

} // namespace voxcarve
