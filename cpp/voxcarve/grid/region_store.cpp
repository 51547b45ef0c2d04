#include "voxcarve/grid/region_store.h"
#include "voxcarve/grid/voxel_grid.h"
#include "voxcarve/core/logging.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <utility>

namespace voxcarve {

namespace {

int offsetSaturated(int v, int d) {
    const std::int64_t r = static_cast<std::int64_t>(v) + d;
    return static_cast<int>(std::max<std::int64_t>(
        std::numeric_limits<int>::min(),
        std::min<std::int64_t>(std::numeric_limits<int>::max(), r)));
}

} // namespace

Region::Region(const VoxelGrid& grid, std::string name, const Vec3i& min, const Vec3i& max)
    : name_(std::move(name)), min_(min), max_(max), mask_(grid.voxelCount(), 0) {
    // Only the part of the box inside the grid is walked.
    Vec3i lo{0, 0, 0};
    Vec3i hi{0, 0, 0};
    bool empty = false;
    for (int axis = 0; axis < 3; ++axis) {
        lo[axis] = std::max(min[axis], 0);
        hi[axis] = std::min(max[axis], grid.size(axis) - 1);
        if (lo[axis] > hi[axis]) empty = true;
    }
    if (!empty) {
        for (int z = lo.z; z <= hi.z; ++z) {
            for (int y = lo.y; y <= hi.y; ++y) {
                for (int x = lo.x; x <= hi.x; ++x) {
                    mask_[grid.idx3(x, y, z)] = 1;
                    ++cellCount_;
                }
            }
        }
    }
    if (cellCount_ == 0) {
        VOXCARVE_LOG_WARN("region '%s' selects no cells", name_.c_str());
    }
}

const Region& RegionStore::add(const VoxelGrid& grid, const std::string& name, const Vec3i& min, const Vec3i& max) {
    for (auto& region : regions_) {
        if (region.name() == name) {
            region = Region(grid, name, min, max);
            return region;
        }
    }
    regions_.emplace_back(grid, name, min, max);
    return regions_.back();
}

bool RegionStore::remove(const std::string& name) {
    for (auto it = regions_.begin(); it != regions_.end(); ++it) {
        if (it->name() == name) {
            regions_.erase(it);
            return true;
        }
    }
    return false;
}

const Region* RegionStore::find(const std::string& name) const noexcept {
    for (const auto& region : regions_) {
        if (region.name() == name) return &region;
    }
    return nullptr;
}

bool RegionStore::anyContains(std::uint32_t index) const noexcept {
    for (const auto& region : regions_) {
        if (region.contains(index)) return true;
    }
    return false;
}

bool RegionStore::reshape(const VoxelGrid& grid, const std::string& name, const Vec3i& min, const Vec3i& max) {
    for (auto& region : regions_) {
        if (region.name() == name) {
            region = Region(grid, name, min, max);
            return true;
        }
    }
    return false;
}

void RegionStore::translate(const VoxelGrid& grid, const Vec3i& offset) {
    for (auto& region : regions_) {
        const Vec3i min{
            offsetSaturated(region.min().x, offset.x),
            offsetSaturated(region.min().y, offset.y),
            offsetSaturated(region.min().z, offset.z),
        };
        const Vec3i max{
            offsetSaturated(region.max().x, offset.x),
            offsetSaturated(region.max().y, offset.y),
            offsetSaturated(region.max().z, offset.z),
        };
        region = Region(grid, region.name(), min, max);
    }
}

} // namespace voxcarve
