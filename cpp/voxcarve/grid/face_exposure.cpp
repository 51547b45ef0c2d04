#include "voxcarve/grid/face_exposure.h"

namespace voxcarve {

bool faceExposed(const VoxelGrid& grid, int x, int y, int z, Face face) noexcept {
    if (face == Face::Ground) return false;
    if (!grid.isSolid(grid.idx3(x, y, z))) return false;
    const Vec3i& d = faceInfo(face).dir;
    const int nx = x + d.x;
    const int ny = y + d.y;
    const int nz = z + d.z;
    if (!grid.within(nx, ny, nz)) return true;
    return !grid.isSolid(grid.idx3(nx, ny, nz));
}

std::uint32_t exposedFaceCount(const VoxelGrid& grid) noexcept {
    std::uint32_t count = 0;
    for (int z = 0; z < grid.sizeZ(); ++z) {
        for (int y = 0; y < grid.sizeY(); ++y) {
            for (int x = 0; x < grid.sizeX(); ++x) {
                for (const Face f : kCardinalFaces) {
                    if (faceExposed(grid, x, y, z, f)) ++count;
                }
            }
        }
    }
    return count;
}

} // namespace voxcarve
