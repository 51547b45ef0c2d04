#include "voxcarve/pick/pick_geometry.h"
#include "voxcarve/pick/pick_codec.h"
#include "voxcarve/grid/face_exposure.h"
#include "voxcarve/core/logging.h"

namespace voxcarve {

namespace {

void pushQuad(const Vec3i& plane, int u, int v, std::uint32_t packed, PickMesh& mesh) {
    float p[4][3];
    for (int c = 0; c < 4; ++c) {
        p[c][0] = static_cast<float>(plane.x);
        p[c][1] = static_cast<float>(plane.y);
        p[c][2] = static_cast<float>(plane.z);
    }
    p[1][u] += 1.0f;
    p[2][u] += 1.0f;
    p[2][v] += 1.0f;
    p[3][v] += 1.0f;

    const std::uint32_t base = mesh.vertexCount();
    for (int c = 0; c < 4; ++c) {
        mesh.positions.insert(mesh.positions.end(), p[c], p[c] + 3);
        mesh.packedIds.push_back(packed);
    }
    const std::uint32_t idx[6] = {base, base + 1, base + 2, base, base + 2, base + 3};
    mesh.indices.insert(mesh.indices.end(), idx, idx + 6);
}

} // namespace

void buildPickFaces(const VoxelGrid& grid, PickGeometry& out) {
    out.clear();

    if (grid.voxelCount() > kMaxPickableVoxels) {
        VOXCARVE_LOG_WARN("grid has %u voxels; pick ids above %u alias", grid.voxelCount(), kMaxPickableVoxels);
    }

    const FaceInfo& groundInfo = faceInfo(Face::Ground);
    for (int z = 0; z < grid.sizeZ(); ++z) {
        for (int x = 0; x < grid.sizeX(); ++x) {
            const std::uint32_t cell = grid.idx3(x, 0, z);
            pushQuad(Vec3i{x, 0, z}, groundInfo.u, groundInfo.v, encodePickId(cell, Face::Ground), out.ground);
        }
    }

    for (int z = 0; z < grid.sizeZ(); ++z) {
        for (int y = 0; y < grid.sizeY(); ++y) {
            for (int x = 0; x < grid.sizeX(); ++x) {
                const std::uint32_t index = grid.idx3(x, y, z);
                if (!grid.isSolid(index)) continue;
                for (const Face f : kCardinalFaces) {
                    if (!faceExposed(grid, x, y, z, f)) continue;
                    const FaceInfo& info = faceInfo(f);
                    Vec3i plane{x, y, z};
                    if (info.dir[info.axis] > 0) plane[info.axis] += 1;
                    pushQuad(plane, info.u, info.v, encodePickId(index, f), out.voxelFaces);
                }
            }
        }
    }
}

} // namespace voxcarve
