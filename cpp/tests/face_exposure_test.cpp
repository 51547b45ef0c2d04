#include <gtest/gtest.h>
#include "voxcarve/grid/face_exposure.h"
#include "voxcarve/grid/voxel_grid.h"

using voxcarve::Face;
using voxcarve::VoxelGrid;
using voxcarve::faceExposed;
using voxcarve::exposedFaceCount;

namespace {

// Checkerboard-ish pattern with holes on every boundary.
void carvePattern(VoxelGrid& grid) {
    for (int z = 0; z < grid.sizeZ(); ++z) {
        for (int y = 0; y < grid.sizeY(); ++y) {
            for (int x = 0; x < grid.sizeX(); ++x) {
                if ((x * 7 + y * 3 + z * 5) % 4 == 0) grid.setSolid(grid.idx3(x, y, z), false);
            }
        }
    }
}

} // namespace

TEST(FaceExposureTest, MatchesNeighborDefinition) {
    VoxelGrid grid(5, 4, 6);
    carvePattern(grid);
    for (int z = 0; z < grid.sizeZ(); ++z) {
        for (int y = 0; y < grid.sizeY(); ++y) {
            for (int x = 0; x < grid.sizeX(); ++x) {
                for (const Face f : voxcarve::kCardinalFaces) {
                    const auto& d = voxcarve::faceInfo(f).dir;
                    const bool solid = grid.isSolid(grid.idx3(x, y, z));
                    const bool neighborOpen = !grid.within(x + d.x, y + d.y, z + d.z)
                        || !grid.isSolid(grid.idx3(x + d.x, y + d.y, z + d.z));
                    EXPECT_EQ(faceExposed(grid, x, y, z, f), solid && neighborOpen)
                        << x << "," << y << "," << z << " face " << int(voxcarve::faceId(f));
                }
            }
        }
    }
}

TEST(FaceExposureTest, BoundaryFacesAlwaysExposed) {
    VoxelGrid grid;
    EXPECT_TRUE(faceExposed(grid, 0, 5, 5, Face::MinusX));
    EXPECT_TRUE(faceExposed(grid, 15, 5, 5, Face::PlusX));
    EXPECT_FALSE(faceExposed(grid, 0, 5, 5, Face::PlusX));
    EXPECT_TRUE(faceExposed(grid, 5, 15, 5, Face::PlusY));
    EXPECT_TRUE(faceExposed(grid, 5, 5, 0, Face::MinusZ));
}

TEST(FaceExposureTest, GroundFaceIsNeverExposed) {
    VoxelGrid grid;
    EXPECT_FALSE(faceExposed(grid, 0, 0, 0, Face::Ground));
}

TEST(FaceExposureTest, NonSolidVoxelHasNoExposedFaces) {
    VoxelGrid grid;
    grid.setSolid(grid.idx3(0, 0, 0), false);
    for (const Face f : voxcarve::kCardinalFaces) {
        EXPECT_FALSE(faceExposed(grid, 0, 0, 0, f));
    }
    EXPECT_TRUE(faceExposed(grid, 1, 0, 0, Face::MinusX));
    EXPECT_TRUE(faceExposed(grid, 0, 1, 0, Face::MinusY));
    EXPECT_TRUE(faceExposed(grid, 0, 0, 1, Face::MinusZ));
}

TEST(FaceExposureTest, FullChunkCount) {
    VoxelGrid grid;
    EXPECT_EQ(exposedFaceCount(grid), 6u * 16u * 16u);
}

TEST(FaceExposureTest, CarvingInteriorVoxelExposesSix) {
    VoxelGrid grid;
    const std::uint32_t before = exposedFaceCount(grid);
    grid.setSolid(grid.idx3(8, 8, 8), false);
    EXPECT_EQ(exposedFaceCount(grid), before + 6u);
}

TEST(FaceExposureTest, CarvingCornerTradesThreeForThree) {
    VoxelGrid grid;
    const std::uint32_t before = exposedFaceCount(grid);
    grid.setSolid(grid.idx3(0, 0, 0), false);
    // The corner's three boundary faces go away; its three positive
    // neighbors each expose one face toward the hole.
    EXPECT_EQ(exposedFaceCount(grid), before);
}

TEST(FaceExposureTest, EmptyGridHasNoFaces) {
    VoxelGrid grid(3, 3, 3);
    grid.fill(false);
    EXPECT_EQ(exposedFaceCount(grid), 0u);
}
