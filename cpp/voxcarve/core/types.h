#ifndef VOXCARVE_CORE_TYPES_H
#define VOXCARVE_CORE_TYPES_H

#include <array>
#include <cstdint>
#include <cstddef>

// Lightweight types and constants shared by the voxel core.

namespace voxcarve {

// Grid defaults
static constexpr int kDefaultGridSize = 16;
static constexpr int kMaterialCount = 16;
static constexpr std::uint8_t kMaterialMask = 0x0F;

// Greedy mesh buffers
static constexpr float kFaceEpsilon = 1e-6f;
static constexpr std::size_t kPositionFloatsPerVertex = 3;
static constexpr std::size_t kNormalFloatsPerVertex = 3;
static constexpr std::size_t kVerticesPerQuad = 4;
static constexpr std::size_t kIndicesPerQuad = 6;

// Pick id layout: ((index + 1) << 4) | face, carried in a 24-bit RGB color.
static constexpr std::uint32_t kPickFaceBits = 3;
static constexpr std::uint32_t kPickFaceMask = (1u << kPickFaceBits) - 1u;
static constexpr std::uint32_t kPickIndexShift = 4;
static constexpr std::uint32_t kPickColorBits = 24;
static constexpr std::uint32_t kMaxPickableVoxels = (1u << (kPickColorBits - kPickIndexShift)) - 1u;

// Resize limits: one axis fits the two hex digits of a wide voxel record, and
// every cell must stay addressable by a pick id.
static constexpr std::uint32_t kMaxGridEdge = 256;
static constexpr std::uint32_t kMaxGridVoxels = kMaxPickableVoxels;

// Command buffer format
static constexpr std::uint32_t commandMagicVxcb = 0x42435856; // "VXCB"
static constexpr std::uint32_t commandVersionVxcb = 1;
static constexpr std::size_t commandHeaderBytes = 4 * 4;
static constexpr std::size_t perCommandHeaderBytes = 4 * 4;

struct Vec3i {
    int x;
    int y;
    int z;

    int& operator[](int axis) { return axis == 0 ? x : (axis == 1 ? y : z); }
    int operator[](int axis) const { return axis == 0 ? x : (axis == 1 ? y : z); }
    bool operator==(const Vec3i& o) const { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const Vec3i& o) const { return !(*this == o); }
};

// Six cardinal faces plus the synthetic ground face used when adding voxels
// onto the y=0 reference plane. Values double as the pick face field.
enum class Face : std::uint8_t {
    PlusX = 0,
    MinusX = 1,
    PlusY = 2,
    MinusY = 3,
    PlusZ = 4,
    MinusZ = 5,
    Ground = 6,
};

static constexpr int kCardinalFaceCount = 6;
static constexpr int kFaceCount = 7;

inline constexpr std::uint8_t faceId(Face f) { return static_cast<std::uint8_t>(f); }

struct FaceInfo {
    Vec3i dir;   // step to the neighbor across this face (zero for Ground)
    int axis;    // normal / sweep axis
    int u;       // first tangent axis
    int v;       // second tangent axis
};

// Row/plane tangent layout per face. Ground sweeps like +Y.
inline constexpr std::array<FaceInfo, kFaceCount> kFaceTable = {{
    {{ 1,  0,  0}, 0, 2, 1},
    {{-1,  0,  0}, 0, 2, 1},
    {{ 0,  1,  0}, 1, 0, 2},
    {{ 0, -1,  0}, 1, 0, 2},
    {{ 0,  0,  1}, 2, 0, 1},
    {{ 0,  0, -1}, 2, 0, 1},
    {{ 0,  0,  0}, 1, 0, 2},
}};

inline constexpr std::array<Face, kCardinalFaceCount> kCardinalFaces = {
    Face::PlusX, Face::MinusX, Face::PlusY, Face::MinusY, Face::PlusZ, Face::MinusZ,
};

inline const FaceInfo& faceInfo(Face f) { return kFaceTable[faceId(f)]; }

struct RgbColor {
    float r;
    float g;
    float b;

    bool operator==(const RgbColor& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const RgbColor& o) const { return !(*this == o); }
};

enum class EngineError : std::uint32_t {
    Ok = 0,
    InvalidMagic = 1,
    UnsupportedVersion = 2,
    BufferTruncated = 3,
    InvalidPayloadSize = 4,
    UnknownCommand = 5,
    InvalidOperation = 6,
};

enum class CommandOp : std::uint32_t {
    Fill = 1,
    SetVoxel = 2,
    Resize = 3,
    ResetSize = 4,
    SeedMaterials = 5,
    AddRegion = 6,
    ClearRegions = 7,
    ApplyTool = 8,
    Shift = 9,
    SetPaletteSlot = 10,
};

// Command Payloads (POD)
struct FillPayload { std::uint32_t solid; std::uint32_t material; };
struct SetVoxelPayload { std::int32_t x, y, z; std::uint32_t solid; std::uint32_t material; };
struct ResizePayload { std::uint32_t sizeX, sizeY, sizeZ; };
struct SeedMaterialsPayload { std::uint32_t mode; std::uint32_t seed; };
// Followed by nameByteCount bytes of UTF-8 name.
struct AddRegionPayloadHeader { std::int32_t minX, minY, minZ, maxX, maxY, maxZ; std::uint32_t nameByteCount; };
struct ApplyToolPayload { std::uint32_t mode; std::uint32_t option; std::int32_t voxel; std::int32_t face; std::uint32_t material; };
struct ShiftPayload { std::int32_t dx, dy, dz; };
struct PaletteSlotPayload { std::uint32_t slot; float r, g, b; };

} // namespace voxcarve

#endif // VOXCARVE_CORE_TYPES_H
