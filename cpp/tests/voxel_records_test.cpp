#include <gtest/gtest.h>
#include "voxcarve/persistence/voxel_records.h"

using voxcarve::VoxelGrid;
using voxcarve::VoxelRecord;

TEST(VoxelRecordsTest, ShortFormIsFourNibbles) {
    EXPECT_EQ(voxcarve::encodeVoxelRecord(VoxelRecord{10, 3, 15, 5}, true), "a3f5");
    EXPECT_EQ(voxcarve::encodeVoxelRecord(VoxelRecord{0, 0, 0, 0}, true), "0000");
}

TEST(VoxelRecordsTest, WideFormIsTwoDigitsPerCoordinate) {
    EXPECT_EQ(voxcarve::encodeVoxelRecord(VoxelRecord{200, 3, 16, 9}, false), "c803109");
    EXPECT_EQ(voxcarve::encodeVoxelRecord(VoxelRecord{1, 2, 3, 15}, false), "010203f");
}

TEST(VoxelRecordsTest, DecodeAcceptsEitherCase) {
    VoxelRecord r{};
    ASSERT_TRUE(voxcarve::decodeVoxelRecord("A3F5", r));
    EXPECT_EQ(r.x, 10);
    EXPECT_EQ(r.y, 3);
    EXPECT_EQ(r.z, 15);
    EXPECT_EQ(r.material, 5);

    ASSERT_TRUE(voxcarve::decodeVoxelRecord("C803109", r));
    EXPECT_EQ(r.x, 200);
    EXPECT_EQ(r.y, 3);
    EXPECT_EQ(r.z, 16);
    EXPECT_EQ(r.material, 9);
}

TEST(VoxelRecordsTest, DecodeRejectsMalformedRecords) {
    VoxelRecord r{};
    EXPECT_FALSE(voxcarve::decodeVoxelRecord("", r));
    EXPECT_FALSE(voxcarve::decodeVoxelRecord("123", r));
    EXPECT_FALSE(voxcarve::decodeVoxelRecord("12345", r));
    EXPECT_FALSE(voxcarve::decodeVoxelRecord("12g4", r));
    EXPECT_FALSE(voxcarve::decodeVoxelRecord("01 0203", r));
}

TEST(VoxelRecordsTest, FormChoiceFollowsLargestDimension) {
    EXPECT_TRUE(voxcarve::usesShortRecords(VoxelGrid(16, 16, 16)));
    EXPECT_FALSE(voxcarve::usesShortRecords(VoxelGrid(16, 17, 4)));
}

TEST(VoxelRecordsTest, ExportListsSolidVoxelsZYX) {
    VoxelGrid grid(3, 3, 3);
    grid.fill(false);
    grid.setSolid(grid.idx3(2, 0, 0), true);
    grid.setSolid(grid.idx3(0, 1, 0), true);
    grid.setSolid(grid.idx3(1, 0, 2), true);
    grid.setMaterial(grid.idx3(1, 0, 2), 11);
    // Non-solid voxels are not exported even when they carry a material.
    grid.setMaterial(grid.idx3(0, 0, 0), 4);

    const auto records = voxcarve::exportVoxelRecords(grid);
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0], "2000");
    EXPECT_EQ(records[1], "0100");
    EXPECT_EQ(records[2], "102b");
}

TEST(VoxelRecordsTest, ExportUsesWideFormForLargeGrids) {
    VoxelGrid grid(20, 2, 2);
    grid.fill(false);
    grid.setSolid(grid.idx3(19, 1, 0), true);
    const auto records = voxcarve::exportVoxelRecords(grid);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], "1301000");
}

TEST(VoxelRecordsTest, ImportReplacesGridContents) {
    VoxelGrid grid(4, 4, 4);
    grid.fillMaterial(7);
    const std::uint32_t applied = voxcarve::importVoxelRecords(grid, {"1235", "0000", "5000", "zz", "000102f"});
    // "5000" is out of bounds, "zz" malformed.
    EXPECT_EQ(applied, 3u);
    EXPECT_EQ(grid.solidCount(), 3u);
    EXPECT_TRUE(grid.isSolid(grid.idx3(1, 2, 3)));
    EXPECT_EQ(grid.material(grid.idx3(1, 2, 3)), 5);
    EXPECT_TRUE(grid.isSolid(grid.idx3(0, 0, 0)));
    EXPECT_TRUE(grid.isSolid(grid.idx3(0, 1, 2)));
    EXPECT_EQ(grid.material(grid.idx3(0, 1, 2)), 15);
    // Everything else was cleared, material included.
    EXPECT_FALSE(grid.isSolid(grid.idx3(3, 3, 3)));
    EXPECT_EQ(grid.material(grid.idx3(3, 3, 3)), 0);
}

TEST(VoxelRecordsTest, ExportThenImportReproducesSolidVoxels) {
    VoxelGrid source(5, 4, 3);
    source.seedMaterials(voxcarve::MaterialSeedMode::Bands);
    source.setSolid(source.idx3(4, 3, 2), false);
    source.setMaterial(source.idx3(4, 3, 2), 0);

    VoxelGrid target(5, 4, 3);
    voxcarve::importVoxelRecords(target, voxcarve::exportVoxelRecords(source));
    for (std::uint32_t i = 0; i < source.voxelCount(); ++i) {
        ASSERT_EQ(target.isSolid(i), source.isSolid(i)) << i;
        ASSERT_EQ(target.material(i), source.material(i)) << i;
    }
}
