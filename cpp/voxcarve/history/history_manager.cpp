#include "voxcarve/history/history_manager.h"
#include "voxcarve/grid/voxel_grid.h"
#include "voxcarve/core/palette_slots.h"
#include "voxcarve/core/logging.h"

#include <utility>

namespace voxcarve {

HistoryManager::HistoryManager(VoxelGrid& grid, PaletteSlots& palette)
    : grid_(grid), palette_(palette) {}

bool HistoryManager::canUndo() const noexcept {
    return cursor_ > 0;
}

bool HistoryManager::canRedo() const noexcept {
    return cursor_ < history_.size();
}

HistoryAction HistoryManager::beginAction(std::string label) const {
    HistoryAction action;
    action.kind = HistoryActionKind::Voxels;
    action.label = std::move(label);
    return action;
}

HistoryAction HistoryManager::beginPaletteAction(std::string label) const {
    HistoryAction action;
    action.kind = HistoryActionKind::Palette;
    action.label = std::move(label);
    return action;
}

bool HistoryManager::recordChange(HistoryAction& action, std::uint32_t index, bool newSolid, std::uint8_t newMaterial) {
    const std::uint8_t toMaterial = static_cast<std::uint8_t>(newMaterial & kMaterialMask);
    const bool fromSolid = grid_.isSolid(index);
    const std::uint8_t fromMaterial = grid_.material(index);
    if (fromSolid == newSolid && fromMaterial == toMaterial) return false;

    action.voxels.push_back(VoxelDiff{index, fromSolid, fromMaterial, newSolid, toMaterial});
    grid_.setSolid(index, newSolid);
    grid_.setMaterial(index, toMaterial);
    return true;
}

bool HistoryManager::recordPaletteChange(HistoryAction& action, std::uint32_t slot, const RgbColor& from, const RgbColor& to) {
    if (!PaletteSlots::validSlot(slot)) return false;
    if (from == to) return false;
    action.palette.push_back(PaletteDiff{slot, from, to});
    palette_.setColor(slot, to);
    return true;
}

bool HistoryManager::commit(HistoryAction&& action) {
    if (action.empty()) {
        VOXCARVE_LOG_DEBUG("history: dropping empty action '%s'", action.label.c_str());
        return false;
    }
    if (cursor_ < history_.size()) {
        history_.erase(history_.begin() + static_cast<std::ptrdiff_t>(cursor_), history_.end());
    }
    history_.push_back(std::move(action));
    cursor_ = history_.size();
    historyGeneration_++;
    return true;
}

void HistoryManager::applyAction(const HistoryAction& action, bool useAfter) {
    if (useAfter) {
        for (const auto& d : action.voxels) {
            grid_.setSolid(d.index, d.toSolid);
            grid_.setMaterial(d.index, d.toMaterial);
        }
        for (const auto& p : action.palette) palette_.setColor(p.slot, p.to);
        for (const auto& m : action.regions) restoreRegion(m.name, m.fromMin, m.fromMax, m.toMin, m.toMax);
        return;
    }
    // Reverse order so a voxel touched twice ends at its first "from".
    for (auto it = action.voxels.rbegin(); it != action.voxels.rend(); ++it) {
        grid_.setSolid(it->index, it->fromSolid);
        grid_.setMaterial(it->index, it->fromMaterial);
    }
    for (auto it = action.palette.rbegin(); it != action.palette.rend(); ++it) {
        palette_.setColor(it->slot, it->from);
    }
    for (auto it = action.regions.rbegin(); it != action.regions.rend(); ++it) {
        restoreRegion(it->name, it->toMin, it->toMax, it->fromMin, it->fromMax);
    }
}

void HistoryManager::restoreRegion(const std::string& name, const Vec3i& curMin, const Vec3i& curMax, const Vec3i& min, const Vec3i& max) {
    // Regions removed or redefined since the action are left alone.
    const Region* region = grid_.regions().find(name);
    if (!region || region->min() != curMin || region->max() != curMax) return;
    grid_.regions().reshape(grid_, name, min, max);
}

bool HistoryManager::undo() {
    if (!canUndo()) return false;
    cursor_--;
    applyAction(history_[cursor_], false);
    historyGeneration_++;
    return true;
}

bool HistoryManager::redo() {
    if (!canRedo()) return false;
    applyAction(history_[cursor_], true);
    cursor_++;
    historyGeneration_++;
    return true;
}

void HistoryManager::clear() {
    history_.clear();
    cursor_ = 0;
    historyGeneration_++;
}

} // namespace voxcarve
