#pragma once

#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#endif

#include "voxcarve/core/types.h"
#include "voxcarve/core/util.h"
#include "voxcarve/core/palette_slots.h"
#include "voxcarve/command/commands.h"
#include "voxcarve/grid/voxel_grid.h"
#include "voxcarve/mesh/greedy_mesher.h"
#include "voxcarve/pick/pick_codec.h"
#include "voxcarve/pick/pick_geometry.h"
#include "voxcarve/history/history_types.h"
#include "voxcarve/history/history_manager.h"
#include "voxcarve/tools/edit_tools.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

// Host-facing facade: owns the chunk, its palette slots and edit history, and
// the derived render/pick buffers. Buffers rebuild lazily on the first meta
// request after a mutation; pointers stay valid until the next rebuild.
class CarveEngine {
public:
    using EngineError = voxcarve::EngineError;
    using CommandOp = voxcarve::CommandOp;
    using PickHit = voxcarve::PickHit;
    using RgbColor = voxcarve::RgbColor;

    // Feature flags for build-time capabilities (protocol handshake).
    enum class EngineFeatureFlags : std::uint32_t {
        FEATURE_PROTOCOL = 1 << 0,
        FEATURE_REGION_MESHES = 1 << 1,
        FEATURE_GROUND_PICK = 1 << 2,
        FEATURE_ENGINE_HISTORY = 1 << 3,
        FEATURE_PALETTE_HISTORY = 1 << 4,
        FEATURE_VOXEL_RECORDS = 1 << 5,
    };

    // Handshake payload (POD): host validates versions + abiHash + feature flags.
    struct ProtocolInfo {
        std::uint32_t protocolVersion;
        std::uint32_t commandVersion;
        std::uint32_t pickFormatVersion;
        std::uint32_t abiHash;
        std::uint32_t featureFlags;
    };

    static constexpr std::uint32_t kProtocolVersion = 1;
    static constexpr std::uint32_t kCommandVersion = voxcarve::commandVersionVxcb;
    static constexpr std::uint32_t kPickFormatVersion = 1; // ((index + 1) << 4) | face
    static constexpr std::uint32_t kFeatureFlags =
        static_cast<std::uint32_t>(EngineFeatureFlags::FEATURE_PROTOCOL)
        | static_cast<std::uint32_t>(EngineFeatureFlags::FEATURE_REGION_MESHES)
        | static_cast<std::uint32_t>(EngineFeatureFlags::FEATURE_GROUND_PICK)
        | static_cast<std::uint32_t>(EngineFeatureFlags::FEATURE_ENGINE_HISTORY)
        | static_cast<std::uint32_t>(EngineFeatureFlags::FEATURE_PALETTE_HISTORY)
        | static_cast<std::uint32_t>(EngineFeatureFlags::FEATURE_VOXEL_RECORDS);
    static constexpr std::uint32_t kAbiHashOffset = 2166136261u;
    static constexpr std::uint32_t kAbiHashPrime = 16777619u;

    struct MeshBufferMeta {
        std::uint32_t generation;
        std::uint32_t vertexCount;
        std::uint32_t indexCount;
        std::uintptr_t positionsPtr; // 3 floats per vertex
        std::uintptr_t normalsPtr;   // 3 floats per vertex
        std::uintptr_t materialsPtr; // 1 byte per vertex
        std::uintptr_t indicesPtr;   // uint32 triangle list
    };

    struct PickBufferMeta {
        std::uint32_t generation;
        std::uint32_t vertexCount;
        std::uint32_t indexCount;
        std::uintptr_t positionsPtr; // 3 floats per vertex
        std::uintptr_t idsPtr;       // 1 packed uint32 id per vertex
        std::uintptr_t indicesPtr;
    };

    struct DocumentDigest {
        std::uint32_t lo;
        std::uint32_t hi;
    };

    struct HistoryMeta {
        std::uint32_t depth;
        std::uint32_t cursor;
        std::uint32_t generation;
    };

    struct EngineStats {
        std::uint32_t generation;
        std::uint32_t voxelCount;
        std::uint32_t solidCount;
        std::uint32_t regionCount;
        std::uint32_t mainQuadCount;
        std::uint32_t regionQuadCount;
        std::uint32_t pickQuadCount;
        std::uint32_t rebuildCount;
        float lastRebuildMs;
        float lastApplyMs;
    };

    CarveEngine();

    // Default chunk, default palette, empty history.
    void clear();

    // Allocate transient bytes inside WASM memory (for the host to copy command buffers).
    std::uintptr_t allocBytes(std::uint32_t byteCount);
    void freeBytes(std::uintptr_t ptr);

    // One buffer = one history entry labelled "Commands".
    void applyCommandBuffer(std::uintptr_t ptr, std::uint32_t byteCount);
    void applyCommandBytes(const std::uint8_t* src, std::uint32_t byteCount);

    EngineError getLastError() const noexcept { return lastError; }

    ProtocolInfo getProtocolInfo() const noexcept {
        return ProtocolInfo{
            kProtocolVersion,
            kCommandVersion,
            kPickFormatVersion,
            getAbiHash(),
            kFeatureFlags
        };
    }

    // Grid
    int getSizeX() const noexcept { return grid_.sizeX(); }
    int getSizeY() const noexcept { return grid_.sizeY(); }
    int getSizeZ() const noexcept { return grid_.sizeZ(); }
    std::uint32_t getVoxelCount() const noexcept { return grid_.voxelCount(); }
    bool isSolid(int x, int y, int z) const noexcept;
    std::uint32_t getMaterial(int x, int y, int z) const noexcept;
    const voxcarve::VoxelGrid& grid() const noexcept { return grid_; }

    // Recorded edits. Each opens its own history entry unless a command
    // buffer already has one open.
    bool setVoxel(int x, int y, int z, bool solid, std::uint8_t material);
    void fill(bool solid, std::uint8_t material);
    bool seedMaterials(std::uint32_t mode, std::uint32_t seed);
    bool applyTool(std::uint32_t mode, std::uint32_t option, std::int32_t voxel, std::int32_t face, std::uint32_t brush);
    bool shiftVoxels(int dx, int dy, int dz);
    bool setPaletteColor(std::uint32_t slot, float r, float g, float b);

    // Structural edits. These reset the history.
    bool resize(std::uint32_t sizeX, std::uint32_t sizeY, std::uint32_t sizeZ);
    void resetSize();
    std::uint32_t importVoxelRecords(const std::vector<std::string>& records);
    std::vector<std::string> exportVoxelRecords() const;

    // Regions are not part of the edit history.
    bool addRegion(const std::string& name, int minX, int minY, int minZ, int maxX, int maxY, int maxZ);
    bool removeRegion(const std::string& name);
    void clearRegions();
    std::uint32_t getRegionCount() const noexcept { return static_cast<std::uint32_t>(grid_.regions().size()); }
    std::string getRegionName(std::uint32_t index) const;

    // Palette
    RgbColor getPaletteColor(std::uint32_t slot) const noexcept;
    std::uintptr_t getPalettePtr() const noexcept { return reinterpret_cast<std::uintptr_t>(palette_.data()); }

    // Render / pick buffers
    MeshBufferMeta getMainMeshMeta() const;
    // Unknown names yield an empty mesh.
    MeshBufferMeta getRegionMeshMeta(const std::string& name) const;
    PickBufferMeta getPickMeta() const;
    PickBufferMeta getGroundPickMeta() const;

    // Picking and tool preview
    PickHit decodePick(std::uint32_t r, std::uint32_t g, std::uint32_t b) const noexcept;
    std::vector<std::uint32_t> toolTargets(std::uint32_t mode, std::uint32_t option, std::int32_t voxel, std::int32_t face) const;

    // History
    HistoryMeta getHistoryMeta() const noexcept;
    bool canUndo() const noexcept;
    bool canRedo() const noexcept;
    void undo();
    void redo();
    std::string getUndoLabel() const;
    std::string getRedoLabel() const;

    DocumentDigest getDocumentDigest() const noexcept;
    EngineStats getStats() const;

#ifdef EMSCRIPTEN
private:
#else
public:
#endif
    voxcarve::VoxelGrid grid_;
    voxcarve::PaletteSlots palette_;
    voxcarve::HistoryManager historyManager_;

    // Open history entry (command buffer or single edit).
    voxcarve::HistoryAction pendingAction_{};
    bool historyOpen_{false};

    mutable voxcarve::MeshScratch meshScratch_;
    mutable voxcarve::SurfaceMesh mainMesh_;
    mutable std::vector<std::pair<std::string, voxcarve::SurfaceMesh>> regionMeshes_;
    mutable voxcarve::SurfaceMesh emptyMesh_;
    mutable voxcarve::PickGeometry pickGeometry_;
    mutable bool meshDirty_{true};
    mutable bool pickDirty_{true};

    std::uint32_t generation{0};
    mutable std::uint32_t rebuildCount_{0};
    mutable float lastRebuildMs{0.0f};
    float lastApplyMs{0.0f};

    // Error handling
    mutable EngineError lastError{EngineError::Ok};
    void clearError() const { lastError = EngineError::Ok; }
    void setError(EngineError err) const { lastError = err; }

    void markDocumentChanged();
    void rebuildMeshes() const;
    void rebuildPickGeometry() const;
    MeshBufferMeta buildMeta(const voxcarve::SurfaceMesh& mesh) const noexcept;
    PickBufferMeta buildMeta(const voxcarve::PickMesh& mesh) const noexcept;

    bool beginHistoryEntry(std::string label, voxcarve::HistoryActionKind kind = voxcarve::HistoryActionKind::Voxels);
    void commitHistoryEntry();
    void discardHistoryEntry();
    void clearHistory();

private:
    static constexpr std::uint32_t hashU32(std::uint32_t h, std::uint32_t v) {
        return (h ^ v) * kAbiHashPrime;
    }

    static constexpr std::uint32_t hashEnum(std::uint32_t h, std::uint32_t tag, std::initializer_list<std::uint32_t> values) {
        h = hashU32(h, tag);
        h = hashU32(h, static_cast<std::uint32_t>(values.size()));
        for (auto v : values) {
            h = hashU32(h, v);
        }
        return h;
    }

    static constexpr std::uint32_t hashStruct(std::uint32_t h, std::uint32_t tag, std::uint32_t size, std::initializer_list<std::uint32_t> offsets) {
        h = hashU32(h, tag);
        h = hashU32(h, size);
        h = hashU32(h, static_cast<std::uint32_t>(offsets.size()));
        for (auto v : offsets) {
            h = hashU32(h, v);
        }
        return h;
    }

    static constexpr std::uint32_t computeAbiHash() {
        using namespace voxcarve;
        std::uint32_t h = kAbiHashOffset;

        h = hashEnum(h, 0xE0000001u, {
            static_cast<std::uint32_t>(CommandOp::Fill),
            static_cast<std::uint32_t>(CommandOp::SetVoxel),
            static_cast<std::uint32_t>(CommandOp::Resize),
            static_cast<std::uint32_t>(CommandOp::ResetSize),
            static_cast<std::uint32_t>(CommandOp::SeedMaterials),
            static_cast<std::uint32_t>(CommandOp::AddRegion),
            static_cast<std::uint32_t>(CommandOp::ClearRegions),
            static_cast<std::uint32_t>(CommandOp::ApplyTool),
            static_cast<std::uint32_t>(CommandOp::Shift),
            static_cast<std::uint32_t>(CommandOp::SetPaletteSlot),
        });

        h = hashEnum(h, 0xE0000002u, {
            static_cast<std::uint32_t>(Face::PlusX),
            static_cast<std::uint32_t>(Face::MinusX),
            static_cast<std::uint32_t>(Face::PlusY),
            static_cast<std::uint32_t>(Face::MinusY),
            static_cast<std::uint32_t>(Face::PlusZ),
            static_cast<std::uint32_t>(Face::MinusZ),
            static_cast<std::uint32_t>(Face::Ground),
        });

        h = hashEnum(h, 0xE0000003u, {
            static_cast<std::uint32_t>(ToolMode::Paint),
            static_cast<std::uint32_t>(ToolMode::Add),
            static_cast<std::uint32_t>(ToolMode::Carve),
            static_cast<std::uint32_t>(ToolOption::Voxel),
            static_cast<std::uint32_t>(ToolOption::Row),
            static_cast<std::uint32_t>(ToolOption::Plane),
        });

        h = hashEnum(h, 0xE0000004u, {
            static_cast<std::uint32_t>(EngineError::Ok),
            static_cast<std::uint32_t>(EngineError::InvalidMagic),
            static_cast<std::uint32_t>(EngineError::UnsupportedVersion),
            static_cast<std::uint32_t>(EngineError::BufferTruncated),
            static_cast<std::uint32_t>(EngineError::InvalidPayloadSize),
            static_cast<std::uint32_t>(EngineError::UnknownCommand),
            static_cast<std::uint32_t>(EngineError::InvalidOperation),
        });

        h = hashStruct(h, 0xE0000010u, sizeof(FillPayload), {
            static_cast<std::uint32_t>(offsetof(FillPayload, solid)),
            static_cast<std::uint32_t>(offsetof(FillPayload, material)),
        });
        h = hashStruct(h, 0xE0000011u, sizeof(SetVoxelPayload), {
            static_cast<std::uint32_t>(offsetof(SetVoxelPayload, x)),
            static_cast<std::uint32_t>(offsetof(SetVoxelPayload, y)),
            static_cast<std::uint32_t>(offsetof(SetVoxelPayload, z)),
            static_cast<std::uint32_t>(offsetof(SetVoxelPayload, solid)),
            static_cast<std::uint32_t>(offsetof(SetVoxelPayload, material)),
        });
        h = hashStruct(h, 0xE0000012u, sizeof(ResizePayload), {
            static_cast<std::uint32_t>(offsetof(ResizePayload, sizeX)),
            static_cast<std::uint32_t>(offsetof(ResizePayload, sizeY)),
            static_cast<std::uint32_t>(offsetof(ResizePayload, sizeZ)),
        });
        h = hashStruct(h, 0xE0000013u, sizeof(SeedMaterialsPayload), {
            static_cast<std::uint32_t>(offsetof(SeedMaterialsPayload, mode)),
            static_cast<std::uint32_t>(offsetof(SeedMaterialsPayload, seed)),
        });
        h = hashStruct(h, 0xE0000014u, sizeof(AddRegionPayloadHeader), {
            static_cast<std::uint32_t>(offsetof(AddRegionPayloadHeader, minX)),
            static_cast<std::uint32_t>(offsetof(AddRegionPayloadHeader, maxZ)),
            static_cast<std::uint32_t>(offsetof(AddRegionPayloadHeader, nameByteCount)),
        });
        h = hashStruct(h, 0xE0000015u, sizeof(ApplyToolPayload), {
            static_cast<std::uint32_t>(offsetof(ApplyToolPayload, mode)),
            static_cast<std::uint32_t>(offsetof(ApplyToolPayload, option)),
            static_cast<std::uint32_t>(offsetof(ApplyToolPayload, voxel)),
            static_cast<std::uint32_t>(offsetof(ApplyToolPayload, face)),
            static_cast<std::uint32_t>(offsetof(ApplyToolPayload, material)),
        });
        h = hashStruct(h, 0xE0000016u, sizeof(ShiftPayload), {
            static_cast<std::uint32_t>(offsetof(ShiftPayload, dx)),
            static_cast<std::uint32_t>(offsetof(ShiftPayload, dy)),
            static_cast<std::uint32_t>(offsetof(ShiftPayload, dz)),
        });
        h = hashStruct(h, 0xE0000017u, sizeof(PaletteSlotPayload), {
            static_cast<std::uint32_t>(offsetof(PaletteSlotPayload, slot)),
            static_cast<std::uint32_t>(offsetof(PaletteSlotPayload, r)),
            static_cast<std::uint32_t>(offsetof(PaletteSlotPayload, g)),
            static_cast<std::uint32_t>(offsetof(PaletteSlotPayload, b)),
        });

        h = hashStruct(h, 0xE0000020u, sizeof(MeshBufferMeta), {
            static_cast<std::uint32_t>(offsetof(MeshBufferMeta, generation)),
            static_cast<std::uint32_t>(offsetof(MeshBufferMeta, vertexCount)),
            static_cast<std::uint32_t>(offsetof(MeshBufferMeta, indexCount)),
            static_cast<std::uint32_t>(offsetof(MeshBufferMeta, positionsPtr)),
            static_cast<std::uint32_t>(offsetof(MeshBufferMeta, normalsPtr)),
            static_cast<std::uint32_t>(offsetof(MeshBufferMeta, materialsPtr)),
            static_cast<std::uint32_t>(offsetof(MeshBufferMeta, indicesPtr)),
        });
        h = hashStruct(h, 0xE0000021u, sizeof(PickBufferMeta), {
            static_cast<std::uint32_t>(offsetof(PickBufferMeta, generation)),
            static_cast<std::uint32_t>(offsetof(PickBufferMeta, vertexCount)),
            static_cast<std::uint32_t>(offsetof(PickBufferMeta, indexCount)),
            static_cast<std::uint32_t>(offsetof(PickBufferMeta, positionsPtr)),
            static_cast<std::uint32_t>(offsetof(PickBufferMeta, idsPtr)),
            static_cast<std::uint32_t>(offsetof(PickBufferMeta, indicesPtr)),
        });

        h = hashU32(h, kPickIndexShift);
        h = hashU32(h, kPickFaceBits);
        return h;
    }

public:
    static std::uint32_t getAbiHash() noexcept {
        static const std::uint32_t hash = computeAbiHash();
        return hash;
    }
};
