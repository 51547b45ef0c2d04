#include "voxcarve/engine.h"
#include "voxcarve/command/command_dispatch.h"
#include "voxcarve/core/logging.h"
#include "voxcarve/persistence/voxel_records.h"

#include <cstdlib>
#include <utility>

using voxcarve::HistoryAction;
using voxcarve::HistoryActionKind;
using voxcarve::Vec3i;

CarveEngine::CarveEngine() :
    historyManager_(grid_, palette_)
{
    lastError = EngineError::Ok;
}

void CarveEngine::clear() {
    grid_.resetSize();
    palette_.reset();
    clearHistory();
    markDocumentChanged();
}

std::uintptr_t CarveEngine::allocBytes(std::uint32_t byteCount) {
    void* p = std::malloc(byteCount);
    return reinterpret_cast<std::uintptr_t>(p);
}

void CarveEngine::freeBytes(std::uintptr_t ptr) {
    std::free(reinterpret_cast<void*>(ptr));
}

void CarveEngine::applyCommandBuffer(std::uintptr_t ptr, std::uint32_t byteCount) {
    applyCommandBytes(reinterpret_cast<const std::uint8_t*>(ptr), byteCount);
}

void CarveEngine::applyCommandBytes(const std::uint8_t* src, std::uint32_t byteCount) {
    clearError();
    const double t0 = voxcarve::nowMs();
    const bool historyStarted = beginHistoryEntry("Commands");

    auto commandCallback = [](void* ctx, std::uint32_t op, std::uint32_t id, const std::uint8_t* payload, std::uint32_t payloadByteCount) -> EngineError {
        return voxcarve::dispatchCommand(reinterpret_cast<CarveEngine*>(ctx), op, id, payload, payloadByteCount);
    };

    const EngineError err = voxcarve::parseCommandBuffer(src, byteCount, commandCallback, this);
    if (err != EngineError::Ok) {
        setError(err);
        if (historyStarted) discardHistoryEntry();
    } else if (historyStarted) {
        commitHistoryEntry();
    }

    const double t1 = voxcarve::nowMs();
    lastApplyMs = static_cast<float>(t1 - t0);
}

bool CarveEngine::isSolid(int x, int y, int z) const noexcept {
    if (!grid_.within(x, y, z)) return false;
    return grid_.isSolid(grid_.idx3(x, y, z));
}

std::uint32_t CarveEngine::getMaterial(int x, int y, int z) const noexcept {
    if (!grid_.within(x, y, z)) return 0;
    return grid_.material(grid_.idx3(x, y, z));
}

// ---------------------------------------------------------------------------
// Recorded edits
// ---------------------------------------------------------------------------

bool CarveEngine::setVoxel(int x, int y, int z, bool solid, std::uint8_t material) {
    if (!grid_.within(x, y, z)) return false;
    const bool historyStarted = beginHistoryEntry("Set voxel");
    const bool changed = historyManager_.recordChange(pendingAction_, grid_.idx3(x, y, z), solid, material);
    if (historyStarted) commitHistoryEntry();
    if (changed) markDocumentChanged();
    return true;
}

void CarveEngine::fill(bool solid, std::uint8_t material) {
    const bool historyStarted = beginHistoryEntry(solid ? "Fill" : "Clear");
    std::uint32_t changed = 0;
    for (std::uint32_t i = 0; i < grid_.voxelCount(); ++i) {
        if (historyManager_.recordChange(pendingAction_, i, solid, material)) ++changed;
    }
    if (historyStarted) commitHistoryEntry();
    if (changed > 0) markDocumentChanged();
}

bool CarveEngine::seedMaterials(std::uint32_t mode, std::uint32_t seed) {
    if (mode > static_cast<std::uint32_t>(voxcarve::MaterialSeedMode::Random)) return false;

    voxcarve::VoxelGrid seeded(grid_.sizeX(), grid_.sizeY(), grid_.sizeZ());
    seeded.seedMaterials(static_cast<voxcarve::MaterialSeedMode>(mode), seed);

    const bool historyStarted = beginHistoryEntry("Seed materials");
    std::uint32_t changed = 0;
    for (std::uint32_t i = 0; i < grid_.voxelCount(); ++i) {
        if (historyManager_.recordChange(pendingAction_, i, grid_.isSolid(i), seeded.material(i))) ++changed;
    }
    if (historyStarted) commitHistoryEntry();
    if (changed > 0) markDocumentChanged();
    return true;
}

bool CarveEngine::applyTool(std::uint32_t mode, std::uint32_t option, std::int32_t voxel, std::int32_t face, std::uint32_t brush) {
    if (!voxcarve::validToolMode(mode) || !voxcarve::validToolOption(option)) return false;
    const auto toolMode = static_cast<voxcarve::ToolMode>(mode);
    const auto toolOption = static_cast<voxcarve::ToolOption>(option);

    const bool historyStarted = beginHistoryEntry(voxcarve::toolLabel(toolMode, toolOption));
    const std::uint32_t changed = voxcarve::recordTool(
        historyManager_, pendingAction_, grid_, toolMode, toolOption,
        PickHit{voxel, face}, static_cast<std::uint8_t>(brush & voxcarve::kMaterialMask));
    if (historyStarted) commitHistoryEntry();
    if (changed > 0) markDocumentChanged();
    return changed > 0;
}

bool CarveEngine::shiftVoxels(int dx, int dy, int dz) {
    const Vec3i offset{dx, dy, dz};
    if (offset == Vec3i{0, 0, 0}) return false;

    const bool historyStarted = beginHistoryEntry(voxcarve::shiftLabel(offset));
    const std::size_t voxelsBefore = pendingAction_.voxels.size();
    const std::size_t regionsBefore = pendingAction_.regions.size();
    voxcarve::recordShift(historyManager_, pendingAction_, grid_, offset);
    const bool changed = pendingAction_.voxels.size() != voxelsBefore
        || pendingAction_.regions.size() != regionsBefore;
    if (historyStarted) commitHistoryEntry();
    if (changed) markDocumentChanged();
    return changed;
}

bool CarveEngine::setPaletteColor(std::uint32_t slot, float r, float g, float b) {
    if (!voxcarve::PaletteSlots::validSlot(slot)) return false;
    const RgbColor from = palette_.color(slot);
    const RgbColor to{r, g, b};

    const bool historyStarted = beginHistoryEntry("Palette color", HistoryActionKind::Palette);
    const bool changed = historyManager_.recordPaletteChange(pendingAction_, slot, from, to);
    if (historyStarted) commitHistoryEntry();
    if (changed) generation++;
    return changed;
}

// ---------------------------------------------------------------------------
// Structural edits
// ---------------------------------------------------------------------------

bool CarveEngine::resize(std::uint32_t sizeX, std::uint32_t sizeY, std::uint32_t sizeZ) {
    if (!voxcarve::supportedGridSize(sizeX, sizeY, sizeZ)) {
        VOXCARVE_LOG_WARN("resize rejected: %ux%ux%u", sizeX, sizeY, sizeZ);
        return false;
    }
    grid_.resize(static_cast<int>(sizeX), static_cast<int>(sizeY), static_cast<int>(sizeZ));
    clearHistory();
    markDocumentChanged();
    return true;
}

void CarveEngine::resetSize() {
    grid_.resetSize();
    clearHistory();
    markDocumentChanged();
}

std::uint32_t CarveEngine::importVoxelRecords(const std::vector<std::string>& records) {
    const std::uint32_t applied = voxcarve::importVoxelRecords(grid_, records);
    clearHistory();
    markDocumentChanged();
    return applied;
}

std::vector<std::string> CarveEngine::exportVoxelRecords() const {
    return voxcarve::exportVoxelRecords(grid_);
}

bool CarveEngine::addRegion(const std::string& name, int minX, int minY, int minZ, int maxX, int maxY, int maxZ) {
    if (name.empty()) return false;
    grid_.addRegion(name, Vec3i{minX, minY, minZ}, Vec3i{maxX, maxY, maxZ});
    markDocumentChanged();
    return true;
}

bool CarveEngine::removeRegion(const std::string& name) {
    if (!grid_.regions().remove(name)) return false;
    markDocumentChanged();
    return true;
}

void CarveEngine::clearRegions() {
    if (grid_.regions().empty()) return;
    grid_.clearRegions();
    markDocumentChanged();
}

std::string CarveEngine::getRegionName(std::uint32_t index) const {
    const auto& regions = grid_.regions().regions();
    if (index >= regions.size()) return std::string();
    return regions[index].name();
}

CarveEngine::RgbColor CarveEngine::getPaletteColor(std::uint32_t slot) const noexcept {
    if (!voxcarve::PaletteSlots::validSlot(slot)) return RgbColor{0.0f, 0.0f, 0.0f};
    return palette_.color(slot);
}

// ---------------------------------------------------------------------------
// Render / pick buffers
// ---------------------------------------------------------------------------

void CarveEngine::markDocumentChanged() {
    meshDirty_ = true;
    pickDirty_ = true;
    generation++;
}

void CarveEngine::rebuildMeshes() const {
    const double t0 = voxcarve::nowMs();
    voxcarve::buildMainMesh(grid_, meshScratch_, mainMesh_);

    const auto& regions = grid_.regions().regions();
    regionMeshes_.resize(regions.size());
    for (std::size_t i = 0; i < regions.size(); ++i) {
        regionMeshes_[i].first = regions[i].name();
        voxcarve::buildRegionMesh(grid_, regions[i], meshScratch_, regionMeshes_[i].second);
    }

    meshDirty_ = false;
    rebuildCount_++;
    lastRebuildMs = static_cast<float>(voxcarve::nowMs() - t0);
}

void CarveEngine::rebuildPickGeometry() const {
    voxcarve::buildPickFaces(grid_, pickGeometry_);
    pickDirty_ = false;
}

CarveEngine::MeshBufferMeta CarveEngine::buildMeta(const voxcarve::SurfaceMesh& mesh) const noexcept {
    return MeshBufferMeta{
        generation,
        mesh.vertexCount(),
        mesh.indexCount(),
        reinterpret_cast<std::uintptr_t>(mesh.positions.data()),
        reinterpret_cast<std::uintptr_t>(mesh.normals.data()),
        reinterpret_cast<std::uintptr_t>(mesh.materials.data()),
        reinterpret_cast<std::uintptr_t>(mesh.indices.data()),
    };
}

CarveEngine::PickBufferMeta CarveEngine::buildMeta(const voxcarve::PickMesh& mesh) const noexcept {
    return PickBufferMeta{
        generation,
        mesh.vertexCount(),
        mesh.indexCount(),
        reinterpret_cast<std::uintptr_t>(mesh.positions.data()),
        reinterpret_cast<std::uintptr_t>(mesh.packedIds.data()),
        reinterpret_cast<std::uintptr_t>(mesh.indices.data()),
    };
}

CarveEngine::MeshBufferMeta CarveEngine::getMainMeshMeta() const {
    if (meshDirty_) rebuildMeshes();
    return buildMeta(mainMesh_);
}

CarveEngine::MeshBufferMeta CarveEngine::getRegionMeshMeta(const std::string& name) const {
    if (meshDirty_) rebuildMeshes();
    for (const auto& entry : regionMeshes_) {
        if (entry.first == name) return buildMeta(entry.second);
    }
    return buildMeta(emptyMesh_);
}

CarveEngine::PickBufferMeta CarveEngine::getPickMeta() const {
    if (pickDirty_) rebuildPickGeometry();
    return buildMeta(pickGeometry_.voxelFaces);
}

CarveEngine::PickBufferMeta CarveEngine::getGroundPickMeta() const {
    if (pickDirty_) rebuildPickGeometry();
    return buildMeta(pickGeometry_.ground);
}

CarveEngine::PickHit CarveEngine::decodePick(std::uint32_t r, std::uint32_t g, std::uint32_t b) const noexcept {
    return voxcarve::decodePickColor(
        static_cast<std::uint8_t>(r & 0xFFu),
        static_cast<std::uint8_t>(g & 0xFFu),
        static_cast<std::uint8_t>(b & 0xFFu),
        grid_.voxelCount());
}

std::vector<std::uint32_t> CarveEngine::toolTargets(std::uint32_t mode, std::uint32_t option, std::int32_t voxel, std::int32_t face) const {
    if (!voxcarve::validToolMode(mode) || !voxcarve::validToolOption(option)) return {};
    return voxcarve::toolTargets(
        grid_,
        static_cast<voxcarve::ToolMode>(mode),
        static_cast<voxcarve::ToolOption>(option),
        PickHit{voxel, face});
}

// ---------------------------------------------------------------------------
// History
// ---------------------------------------------------------------------------

bool CarveEngine::beginHistoryEntry(std::string label, HistoryActionKind kind) {
    if (historyOpen_) return false;
    pendingAction_ = kind == HistoryActionKind::Palette
        ? historyManager_.beginPaletteAction(std::move(label))
        : historyManager_.beginAction(std::move(label));
    historyOpen_ = true;
    return true;
}

void CarveEngine::commitHistoryEntry() {
    historyOpen_ = false;
    historyManager_.commit(std::move(pendingAction_));
    pendingAction_ = HistoryAction{};
}

void CarveEngine::discardHistoryEntry() {
    historyOpen_ = false;
    pendingAction_ = HistoryAction{};
}

void CarveEngine::clearHistory() {
    historyManager_.clear();
    // Diffs already recorded refer to the old layout.
    pendingAction_.voxels.clear();
    pendingAction_.palette.clear();
    pendingAction_.regions.clear();
}

CarveEngine::HistoryMeta CarveEngine::getHistoryMeta() const noexcept {
    return HistoryMeta{
        static_cast<std::uint32_t>(historyManager_.getHistorySize()),
        static_cast<std::uint32_t>(historyManager_.getCursor()),
        historyManager_.getGeneration(),
    };
}

bool CarveEngine::canUndo() const noexcept {
    return historyManager_.canUndo();
}

bool CarveEngine::canRedo() const noexcept {
    return historyManager_.canRedo();
}

void CarveEngine::undo() {
    if (historyOpen_) return;
    if (historyManager_.undo()) markDocumentChanged();
}

void CarveEngine::redo() {
    if (historyOpen_) return;
    if (historyManager_.redo()) markDocumentChanged();
}

std::string CarveEngine::getUndoLabel() const {
    const HistoryAction* action = historyManager_.peekUndo();
    return action ? action->label : std::string();
}

std::string CarveEngine::getRedoLabel() const {
    const HistoryAction* action = historyManager_.peekRedo();
    return action ? action->label : std::string();
}

CarveEngine::EngineStats CarveEngine::getStats() const {
    if (meshDirty_) rebuildMeshes();
    if (pickDirty_) rebuildPickGeometry();
    std::uint32_t regionQuads = 0;
    for (const auto& entry : regionMeshes_) regionQuads += entry.second.quadCount;
    return EngineStats{
        generation,
        grid_.voxelCount(),
        grid_.solidCount(),
        static_cast<std::uint32_t>(grid_.regions().size()),
        mainMesh_.quadCount,
        regionQuads,
        pickGeometry_.voxelFaces.quadCount(),
        rebuildCount_,
        lastRebuildMs,
        lastApplyMs
    };
}
