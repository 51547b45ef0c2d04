#include "voxcarve/mesh/greedy_mesher.h"

#include <algorithm>

namespace voxcarve {

namespace {

bool includeMain(const void* /*ctx*/, const VoxelGrid& grid, std::uint32_t index) {
    if (!grid.isSolid(index)) return false;
    return !grid.regions().anyContains(index);
}

bool includeRegion(const void* ctx, const VoxelGrid& grid, std::uint32_t index) {
    const auto* region = static_cast<const Region*>(ctx);
    if (!grid.isSolid(index)) return false;
    return region != nullptr && region->contains(index);
}

void emitQuad(
    const Vec3i& base,
    int axis, int u, int v,
    int w, int h,
    int sign,
    std::uint8_t material,
    SurfaceMesh& out
) {
    float corners[4][3];
    for (int c = 0; c < 4; ++c) {
        corners[c][0] = static_cast<float>(base.x);
        corners[c][1] = static_cast<float>(base.y);
        corners[c][2] = static_cast<float>(base.z);
    }
    corners[1][u] += static_cast<float>(w);
    corners[2][u] += static_cast<float>(w);
    corners[2][v] += static_cast<float>(h);
    corners[3][v] += static_cast<float>(h);

    const float offset = static_cast<float>(sign) * kFaceEpsilon;
    float normal[3] = {0.0f, 0.0f, 0.0f};
    normal[axis] = static_cast<float>(sign);

    const std::uint32_t baseIndex = out.vertexCount();
    for (int c = 0; c < 4; ++c) {
        corners[c][axis] += offset;
        out.positions.insert(out.positions.end(), corners[c], corners[c] + 3);
        out.normals.insert(out.normals.end(), normal, normal + 3);
        out.materials.push_back(material);
    }

    // Winding follows the side so the front face always points along the normal.
    if (sign > 0) {
        const std::uint32_t idx[6] = {baseIndex, baseIndex + 1, baseIndex + 2, baseIndex, baseIndex + 2, baseIndex + 3};
        out.indices.insert(out.indices.end(), idx, idx + 6);
    } else {
        const std::uint32_t idx[6] = {baseIndex, baseIndex + 3, baseIndex + 2, baseIndex, baseIndex + 2, baseIndex + 1};
        out.indices.insert(out.indices.end(), idx, idx + 6);
    }
    out.quadCount++;
}

} // namespace

void buildGreedyMesh(
    const VoxelGrid& grid,
    VoxelPredicateFn include,
    const void* ctx,
    MeshScratch& scratch,
    SurfaceMesh& out
) {
    out.clear();
    if (!include) return;

    const Vec3i dims = grid.dims();
    auto selected = [&](const Vec3i& c) {
        return grid.within(c) && include(ctx, grid, grid.idx3(c));
    };

    for (int axis = 0; axis < 3; ++axis) {
        const int u = (axis + 1) % 3;
        const int v = (axis + 2) % 3;
        const int du = dims[u];
        const int dv = dims[v];

        for (int sign = 1; sign >= -1; sign -= 2) {
            for (int k = 0; k <= dims[axis]; ++k) {
                std::int16_t* mask = scratch.prepare(static_cast<std::size_t>(du) * dv);

                for (int j = 0; j < dv; ++j) {
                    for (int i = 0; i < du; ++i) {
                        Vec3i c{0, 0, 0};
                        c[u] = i;
                        c[v] = j;
                        c[axis] = sign > 0 ? k - 1 : k;
                        if (!selected(c)) continue;
                        Vec3i n = c;
                        n[axis] += sign;
                        if (selected(n)) continue;
                        mask[i + du * j] = static_cast<std::int16_t>(grid.material(grid.idx3(c)));
                    }
                }

                for (int j = 0; j < dv; ++j) {
                    int i = 0;
                    while (i < du) {
                        const std::int16_t m = mask[i + du * j];
                        if (m == MeshScratch::kEmpty) {
                            ++i;
                            continue;
                        }
                        int w = 1;
                        while (i + w < du && mask[(i + w) + du * j] == m) ++w;
                        int h = 1;
                        bool grow = true;
                        while (grow && j + h < dv) {
                            for (int x = 0; x < w; ++x) {
                                if (mask[(i + x) + du * (j + h)] != m) {
                                    grow = false;
                                    break;
                                }
                            }
                            if (grow) ++h;
                        }

                        Vec3i base{0, 0, 0};
                        base[u] = i;
                        base[v] = j;
                        base[axis] = k;
                        emitQuad(base, axis, u, v, w, h, sign, static_cast<std::uint8_t>(m), out);

                        for (int y = 0; y < h; ++y) {
                            std::fill(mask + (i + du * (j + y)), mask + (i + w + du * (j + y)), MeshScratch::kEmpty);
                        }
                        i += w;
                    }
                }
            }
        }
    }
}

void buildMainMesh(const VoxelGrid& grid, MeshScratch& scratch, SurfaceMesh& out) {
    buildGreedyMesh(grid, &includeMain, nullptr, scratch, out);
}

void buildRegionMesh(const VoxelGrid& grid, const Region& region, MeshScratch& scratch, SurfaceMesh& out) {
    buildGreedyMesh(grid, &includeRegion, &region, scratch, out);
}

bool buildRegionMesh(const VoxelGrid& grid, const std::string& regionName, MeshScratch& scratch, SurfaceMesh& out) {
    const Region* region = grid.regions().find(regionName);
    if (!region) {
        out.clear();
        return false;
    }
    buildRegionMesh(grid, *region, scratch, out);
    return true;
}

} // namespace voxcarve
