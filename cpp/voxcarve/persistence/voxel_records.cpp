#include "voxcarve/persistence/voxel_records.h"
#include "voxcarve/core/logging.h"

#include <algorithm>

namespace voxcarve {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

bool allHex(std::string_view text) {
    for (char c : text) {
        if (hexValue(c) < 0) return false;
    }
    return true;
}

void appendHex1(std::string& out, int v) {
    out.push_back(kHexDigits[(v >= 0 && v <= 15) ? v : 0]);
}

void appendHex2(std::string& out, int v) {
    const int clamped = std::max(0, std::min(255, v));
    out.push_back(kHexDigits[(clamped >> 4) & 0xF]);
    out.push_back(kHexDigits[clamped & 0xF]);
}

} // namespace

std::string encodeVoxelRecord(const VoxelRecord& record, bool shortForm) {
    std::string out;
    if (shortForm) {
        out.reserve(4);
        appendHex1(out, record.x);
        appendHex1(out, record.y);
        appendHex1(out, record.z);
    } else {
        out.reserve(7);
        appendHex2(out, record.x);
        appendHex2(out, record.y);
        appendHex2(out, record.z);
    }
    appendHex1(out, record.material & kMaterialMask);
    return out;
}

bool decodeVoxelRecord(std::string_view text, VoxelRecord& out) {
    if (!allHex(text)) return false;
    if (text.size() == 4) {
        out.x = hexValue(text[0]);
        out.y = hexValue(text[1]);
        out.z = hexValue(text[2]);
        out.material = static_cast<std::uint8_t>(hexValue(text[3]) & kMaterialMask);
        return true;
    }
    if (text.size() == 7) {
        out.x = (hexValue(text[0]) << 4) | hexValue(text[1]);
        out.y = (hexValue(text[2]) << 4) | hexValue(text[3]);
        out.z = (hexValue(text[4]) << 4) | hexValue(text[5]);
        out.material = static_cast<std::uint8_t>(hexValue(text[6]) & kMaterialMask);
        return true;
    }
    return false;
}

std::vector<std::string> exportVoxelRecords(const VoxelGrid& grid) {
    const bool shortForm = usesShortRecords(grid);
    std::vector<std::string> out;
    out.reserve(grid.solidCount());
    for (int z = 0; z < grid.sizeZ(); ++z) {
        for (int y = 0; y < grid.sizeY(); ++y) {
            for (int x = 0; x < grid.sizeX(); ++x) {
                const std::uint32_t index = grid.idx3(x, y, z);
                if (!grid.isSolid(index)) continue;
                out.push_back(encodeVoxelRecord(VoxelRecord{x, y, z, grid.material(index)}, shortForm));
            }
        }
    }
    return out;
}

std::uint32_t importVoxelRecords(VoxelGrid& grid, const std::vector<std::string>& records) {
    grid.fill(false);
    grid.fillMaterial(0);

    std::uint32_t applied = 0;
    std::uint32_t skipped = 0;
    for (const auto& text : records) {
        VoxelRecord r{};
        if (!decodeVoxelRecord(text, r) || !grid.within(r.x, r.y, r.z)) {
            ++skipped;
            continue;
        }
        const std::uint32_t index = grid.idx3(r.x, r.y, r.z);
        grid.setSolid(index, true);
        grid.setMaterial(index, r.material);
        ++applied;
    }
    if (skipped > 0) {
        VOXCARVE_LOG_WARN("import skipped %u voxel records", skipped);
    }
    return applied;
}

} // namespace voxcarve
