#pragma once

#include "voxcarve/history/history_types.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace voxcarve {

class VoxelGrid;
class PaletteSlots;

// Linear undo/redo over committed actions. Changes are applied to the grid as
// they are recorded; commit only files the action. Nothing here triggers mesh
// regeneration.
class HistoryManager {
public:
    HistoryManager(VoxelGrid& grid, PaletteSlots& palette);

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;

    HistoryAction beginAction(std::string label) const;
    HistoryAction beginPaletteAction(std::string label) const;

    // Returns false (and records nothing) when the voxel already has that state.
    bool recordChange(HistoryAction& action, std::uint32_t index, bool newSolid, std::uint8_t newMaterial);
    // Returns false when from == to. The slot is set to `to`.
    bool recordPaletteChange(HistoryAction& action, std::uint32_t slot, const RgbColor& from, const RgbColor& to);

    // Zero-diff actions are dropped and leave both stacks untouched.
    bool commit(HistoryAction&& action);

    bool undo();
    bool redo();

    void clear();

    std::uint32_t getGeneration() const noexcept { return historyGeneration_; }
    std::size_t getHistorySize() const noexcept { return history_.size(); }
    std::size_t getCursor() const noexcept { return cursor_; }
    std::size_t undoDepth() const noexcept { return cursor_; }
    std::size_t redoDepth() const noexcept { return history_.size() - cursor_; }

    const HistoryAction* peekUndo() const noexcept { return canUndo() ? &history_[cursor_ - 1] : nullptr; }
    const HistoryAction* peekRedo() const noexcept { return canRedo() ? &history_[cursor_] : nullptr; }

private:
    void applyAction(const HistoryAction& action, bool useAfter);
    void restoreRegion(const std::string& name, const Vec3i& curMin, const Vec3i& curMax, const Vec3i& min, const Vec3i& max);

    VoxelGrid& grid_;
    PaletteSlots& palette_;

    std::vector<HistoryAction> history_;
    std::size_t cursor_ = 0;
    std::uint32_t historyGeneration_ = 0;
};

} // namespace voxcarve
