#include <gtest/gtest.h>
#include "tests/engine_test_common.h"

#include <limits>

using voxcarve::CommandOp;
using voxcarve::EngineError;
using voxcarve::Face;
using voxcarve_test::CommandBufferBuilder;

TEST(CarveEngineTest, ProtocolInfoIsStable) {
    CarveEngine engine;
    const auto info = engine.getProtocolInfo();
    EXPECT_EQ(info.protocolVersion, CarveEngine::kProtocolVersion);
    EXPECT_EQ(info.commandVersion, voxcarve::commandVersionVxcb);
    EXPECT_EQ(info.pickFormatVersion, CarveEngine::kPickFormatVersion);
    EXPECT_NE(info.abiHash, 0u);
    EXPECT_EQ(info.abiHash, CarveEngine::getAbiHash());
    EXPECT_EQ(info.featureFlags, CarveEngine::kFeatureFlags);
}

TEST(CarveEngineTest, DefaultChunkMeshesToSixQuads) {
    CarveEngine engine;
    EXPECT_EQ(engine.getVoxelCount(), 4096u);
    const auto meta = engine.getMainMeshMeta();
    EXPECT_EQ(meta.vertexCount, 24u);
    EXPECT_EQ(meta.indexCount, 36u);
    EXPECT_NE(meta.positionsPtr, 0u);
    EXPECT_NE(meta.indicesPtr, 0u);
}

TEST(CarveEngineTest, BuffersRebuildOnlyAfterChanges) {
    CarveEngine engine;
    const auto first = engine.getMainMeshMeta();
    EXPECT_EQ(engine.rebuildCount_, 1u);
    const auto again = engine.getMainMeshMeta();
    EXPECT_EQ(engine.rebuildCount_, 1u);
    EXPECT_EQ(first.generation, again.generation);

    ASSERT_TRUE(engine.setVoxel(0, 0, 0, false, 0));
    EXPECT_TRUE(engine.meshDirty_);
    const auto after = engine.getMainMeshMeta();
    EXPECT_EQ(engine.rebuildCount_, 2u);
    EXPECT_GT(after.generation, first.generation);
    EXPECT_EQ(after.vertexCount, 12u * 4u);
}

TEST(CarveEngineTest, NoOpEditKeepsGeneration) {
    CarveEngine engine;
    const std::uint32_t before = engine.getMainMeshMeta().generation;
    ASSERT_TRUE(engine.setVoxel(3, 3, 3, true, 0));
    EXPECT_EQ(engine.getMainMeshMeta().generation, before);
    EXPECT_FALSE(engine.canUndo());
}

TEST(CarveEngineTest, SetVoxelOutsideGridIsRejected) {
    CarveEngine engine;
    EXPECT_FALSE(engine.setVoxel(-1, 0, 0, false, 0));
    EXPECT_FALSE(engine.setVoxel(0, 16, 0, false, 0));
    EXPECT_FALSE(engine.isSolid(0, 16, 0));
    EXPECT_EQ(engine.getMaterial(99, 0, 0), 0u);
}

TEST(CarveEngineTest, OneBufferIsOneHistoryEntry) {
    CarveEngine engine;
    CommandBufferBuilder b;
    b.add(CommandOp::SetVoxel, voxcarve::SetVoxelPayload{0, 0, 0, 0, 0});
    b.add(CommandOp::SetVoxel, voxcarve::SetVoxelPayload{1, 0, 0, 1, 7});
    b.add(CommandOp::SetVoxel, voxcarve::SetVoxelPayload{2, 0, 0, 0, 0});
    b.applyTo(engine);

    ASSERT_EQ(engine.getLastError(), EngineError::Ok);
    const auto meta = engine.getHistoryMeta();
    EXPECT_EQ(meta.depth, 1u);
    EXPECT_EQ(meta.cursor, 1u);
    EXPECT_EQ(engine.getUndoLabel(), "Commands");

    engine.undo();
    EXPECT_TRUE(engine.isSolid(0, 0, 0));
    EXPECT_TRUE(engine.isSolid(2, 0, 0));
    EXPECT_EQ(engine.getMaterial(1, 0, 0), 0u);
    EXPECT_EQ(engine.getRedoLabel(), "Commands");

    engine.redo();
    EXPECT_FALSE(engine.isSolid(0, 0, 0));
    EXPECT_EQ(engine.getMaterial(1, 0, 0), 7u);
}

TEST(CarveEngineTest, FailedBufferReportsErrorAndAddsNoEntry) {
    CarveEngine engine;
    CommandBufferBuilder b;
    b.add(CommandOp::SetVoxel, voxcarve::SetVoxelPayload{0, 0, 0, 0, 0});
    b.addRaw(1234, nullptr, 0);
    b.applyTo(engine);

    EXPECT_EQ(engine.getLastError(), EngineError::UnknownCommand);
    EXPECT_FALSE(engine.canUndo());
    EXPECT_EQ(engine.getHistoryMeta().depth, 0u);
    // Commands before the failing one stay applied.
    EXPECT_FALSE(engine.isSolid(0, 0, 0));

    CommandBufferBuilder ok;
    ok.add(CommandOp::ClearRegions);
    ok.applyTo(engine);
    EXPECT_EQ(engine.getLastError(), EngineError::Ok);
}

TEST(CarveEngineTest, EachDirectEditIsItsOwnEntry) {
    CarveEngine engine;
    engine.fill(false, 0);
    EXPECT_EQ(engine.getUndoLabel(), "Clear");
    ASSERT_TRUE(engine.seedMaterials(0, 0));
    EXPECT_EQ(engine.getUndoLabel(), "Seed materials");
    ASSERT_TRUE(engine.setVoxel(4, 4, 4, true, 9));
    EXPECT_EQ(engine.getUndoLabel(), "Set voxel");
    EXPECT_EQ(engine.getHistoryMeta().depth, 3u);
    EXPECT_FALSE(engine.seedMaterials(9, 0));
}

TEST(CarveEngineTest, ResizeValidatesAndClearsHistory) {
    CarveEngine engine;
    ASSERT_TRUE(engine.setVoxel(0, 0, 0, false, 0));
    ASSERT_TRUE(engine.canUndo());

    EXPECT_FALSE(engine.resize(0, 4, 4));
    EXPECT_FALSE(engine.resize(0x80000000u, 1, 1));
    EXPECT_FALSE(engine.resize(257, 1, 1));
    EXPECT_FALSE(engine.resize(256, 256, 256));
    EXPECT_TRUE(engine.canUndo());
    EXPECT_EQ(engine.getSizeX(), 16);
    EXPECT_EQ(engine.getVoxelCount(), 4096u);

    ASSERT_TRUE(engine.resize(4, 5, 6));
    EXPECT_FALSE(engine.canUndo());
    EXPECT_EQ(engine.getVoxelCount(), 120u);
    EXPECT_FALSE(engine.isSolid(0, 0, 0));
    EXPECT_TRUE(engine.isSolid(3, 4, 5));

    engine.resetSize();
    EXPECT_EQ(engine.getVoxelCount(), 4096u);
    EXPECT_TRUE(engine.isSolid(0, 0, 0));
}

TEST(CarveEngineTest, ImportClearsHistory) {
    CarveEngine engine;
    engine.fill(false, 0);
    ASSERT_TRUE(engine.canUndo());
    EXPECT_EQ(engine.importVoxelRecords({"1232", "bogus", "fff1"}), 2u);
    EXPECT_FALSE(engine.canUndo());
    EXPECT_TRUE(engine.isSolid(1, 2, 3));
    EXPECT_EQ(engine.getMaterial(15, 15, 15), 1u);
    EXPECT_EQ(engine.grid().solidCount(), 2u);

    const auto records = engine.exportVoxelRecords();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0], "1232");
}

TEST(CarveEngineTest, RegionsGetTheirOwnMesh) {
    CarveEngine engine;
    const auto mainBefore = engine.getMainMeshMeta().vertexCount;
    ASSERT_TRUE(engine.addRegion("lid", 0, 15, 0, 15, 15, 15));
    EXPECT_FALSE(engine.addRegion("", 0, 0, 0, 1, 1, 1));
    EXPECT_EQ(engine.getRegionCount(), 1u);
    EXPECT_EQ(engine.getRegionName(0), "lid");
    EXPECT_EQ(engine.getRegionName(5), "");

    EXPECT_GT(engine.getRegionMeshMeta("lid").vertexCount, 0u);
    EXPECT_EQ(engine.getRegionMeshMeta("nope").vertexCount, 0u);
    EXPECT_EQ(engine.getRegionMeshMeta("nope").indexCount, 0u);
    EXPECT_GT(engine.getMainMeshMeta().vertexCount, 0u);

    // Regions are not edits.
    EXPECT_FALSE(engine.canUndo());

    EXPECT_TRUE(engine.removeRegion("lid"));
    EXPECT_FALSE(engine.removeRegion("lid"));
    EXPECT_EQ(engine.getRegionMeshMeta("lid").vertexCount, 0u);
    EXPECT_EQ(engine.getMainMeshMeta().vertexCount, mainBefore);
}

TEST(CarveEngineTest, PickBuffersAndDecode) {
    CarveEngine engine;
    const auto pick = engine.getPickMeta();
    EXPECT_EQ(pick.vertexCount, 1536u * 4u);
    EXPECT_EQ(pick.indexCount, 1536u * 6u);
    const auto ground = engine.getGroundPickMeta();
    EXPECT_EQ(ground.vertexCount, 256u * 4u);

    const std::uint32_t packed = voxcarve::encodePickId(5, Face::PlusY);
    const auto rgb = voxcarve::colorFromPacked(packed);
    const auto hit = engine.decodePick(rgb[0], rgb[1], rgb[2]);
    EXPECT_EQ(hit.voxel, 5);
    EXPECT_EQ(hit.face, static_cast<std::int32_t>(Face::PlusY));

    EXPECT_FALSE(engine.decodePick(0, 0, 0).isHit());
    const auto far = voxcarve::colorFromPacked(voxcarve::encodePickId(4096, Face::PlusX));
    EXPECT_FALSE(engine.decodePick(far[0], far[1], far[2]).isHit());
}

TEST(CarveEngineTest, ToolApplyAndUndo) {
    CarveEngine engine;
    const auto top = static_cast<std::int32_t>(engine.grid().idx3(3, 15, 3));
    const std::uint32_t carve = static_cast<std::uint32_t>(voxcarve::ToolMode::Carve);
    const std::uint32_t row = static_cast<std::uint32_t>(voxcarve::ToolOption::Row);
    const auto face = static_cast<std::int32_t>(Face::PlusY);

    EXPECT_EQ(engine.toolTargets(carve, row, top, face).size(), 16u);
    EXPECT_TRUE(engine.toolTargets(5, row, top, face).empty());
    ASSERT_TRUE(engine.applyTool(carve, row, top, face, 0));
    EXPECT_EQ(engine.getUndoLabel(), "Remove row");
    EXPECT_FALSE(engine.isSolid(3, 0, 3));
    EXPECT_FALSE(engine.isSolid(3, 15, 3));

    engine.undo();
    EXPECT_TRUE(engine.isSolid(3, 0, 3));
    EXPECT_TRUE(engine.canRedo());
    EXPECT_FALSE(engine.applyTool(9, row, top, face, 0));
}

TEST(CarveEngineTest, ShiftThroughEngine) {
    CarveEngine engine;
    ASSERT_TRUE(engine.resize(4, 4, 4));
    engine.fill(false, 0);
    ASSERT_TRUE(engine.setVoxel(0, 0, 0, true, 2));
    EXPECT_FALSE(engine.shiftVoxels(0, 0, 0));
    ASSERT_TRUE(engine.shiftVoxels(0, 0, 2));
    EXPECT_EQ(engine.getUndoLabel(), "Shift +Z");
    EXPECT_TRUE(engine.isSolid(0, 0, 2));
    EXPECT_EQ(engine.getMaterial(0, 0, 2), 2u);
    engine.undo();
    EXPECT_TRUE(engine.isSolid(0, 0, 0));
    EXPECT_FALSE(engine.isSolid(0, 0, 2));
}

TEST(CarveEngineTest, ShiftUndoMovesOnlyShiftedRegions) {
    CarveEngine engine;
    ASSERT_TRUE(engine.addRegion("a", 4, 0, 0, 5, 1, 1));
    ASSERT_TRUE(engine.shiftVoxels(2, 0, 0));
    ASSERT_TRUE(engine.addRegion("b", 10, 0, 0, 11, 1, 1));

    engine.undo();
    EXPECT_EQ(engine.grid().regions().find("a")->min().x, 4);
    EXPECT_EQ(engine.grid().regions().find("b")->min().x, 10);
}

TEST(CarveEngineTest, ShiftWithHugeOffsetEmptiesGrid) {
    CarveEngine engine;
    ASSERT_TRUE(engine.shiftVoxels(0, std::numeric_limits<int>::min(), 0));
    EXPECT_EQ(engine.getUndoLabel(), "Shift -Y");
    EXPECT_EQ(engine.grid().solidCount(), 0u);
    engine.undo();
    EXPECT_EQ(engine.grid().solidCount(), 4096u);
}

TEST(CarveEngineTest, PaletteEditsAreUndoable) {
    CarveEngine engine;
    const auto original = engine.getPaletteColor(3);
    ASSERT_TRUE(engine.setPaletteColor(3, 0.1f, 0.2f, 0.3f));
    EXPECT_FALSE(engine.setPaletteColor(3, 0.1f, 0.2f, 0.3f));
    EXPECT_FALSE(engine.setPaletteColor(16, 0.0f, 0.0f, 0.0f));
    EXPECT_EQ(engine.getUndoLabel(), "Palette color");
    EXPECT_EQ(engine.getPaletteColor(3).b, 0.3f);

    const float* flat = reinterpret_cast<const float*>(engine.getPalettePtr());
    EXPECT_EQ(flat[3 * 3 + 0], 0.1f);

    engine.undo();
    EXPECT_EQ(engine.getPaletteColor(3), original);
    engine.redo();
    EXPECT_EQ(engine.getPaletteColor(3).r, 0.1f);
}

TEST(CarveEngineTest, StatsReflectState) {
    CarveEngine engine;
    engine.addRegion("corner", 0, 0, 0, 1, 1, 1);
    const auto stats = engine.getStats();
    EXPECT_EQ(stats.voxelCount, 4096u);
    EXPECT_EQ(stats.solidCount, 4096u);
    EXPECT_EQ(stats.regionCount, 1u);
    EXPECT_GT(stats.mainQuadCount, 0u);
    EXPECT_GT(stats.regionQuadCount, 0u);
    EXPECT_EQ(stats.pickQuadCount, 1536u);
    EXPECT_GE(stats.rebuildCount, 1u);
}

TEST(CarveEngineTest, ClearRestoresDefaults) {
    CarveEngine engine;
    engine.resize(3, 3, 3);
    engine.setPaletteColor(0, 0.0f, 0.0f, 0.0f);
    engine.addRegion("a", 0, 0, 0, 1, 1, 1);
    engine.clear();
    EXPECT_EQ(engine.getVoxelCount(), 4096u);
    EXPECT_EQ(engine.getRegionCount(), 0u);
    EXPECT_FALSE(engine.canUndo());
    EXPECT_EQ(engine.getPaletteColor(0), voxcarve::PaletteSlots().color(0));
}

TEST(CarveEngineTest, AllocatedBytesCarryCommands) {
    CarveEngine engine;
    CommandBufferBuilder b;
    b.add(CommandOp::Fill, voxcarve::FillPayload{0, 0});
    const std::uintptr_t ptr = engine.allocBytes(b.size());
    ASSERT_NE(ptr, 0u);
    std::memcpy(reinterpret_cast<void*>(ptr), b.data(), b.size());
    engine.applyCommandBuffer(ptr, b.size());
    engine.freeBytes(ptr);
    EXPECT_EQ(engine.getLastError(), EngineError::Ok);
    EXPECT_EQ(engine.grid().solidCount(), 0u);
}
