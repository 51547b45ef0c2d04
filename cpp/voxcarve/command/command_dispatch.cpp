#include "voxcarve/command/command_dispatch.h"
#include "voxcarve/engine.h"
#include "voxcarve/core/util.h"
#include <cstring>
#include <string>

namespace voxcarve {

EngineError dispatchCommand(
    CarveEngine* self,
    std::uint32_t op,
    std::uint32_t /*id*/,
    const std::uint8_t* payload,
    std::uint32_t payloadByteCount
) {
    switch (op) {
        case static_cast<std::uint32_t>(CommandOp::Fill): {
            FillPayload p;
            if (payloadByteCount != sizeof(FillPayload) || !readPayload(payload, payloadByteCount, p)) {
                return EngineError::InvalidPayloadSize;
            }
            self->fill(p.solid != 0, static_cast<std::uint8_t>(p.material & kMaterialMask));
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::SetVoxel): {
            SetVoxelPayload p;
            if (payloadByteCount != sizeof(SetVoxelPayload) || !readPayload(payload, payloadByteCount, p)) {
                return EngineError::InvalidPayloadSize;
            }
            if (!self->setVoxel(p.x, p.y, p.z, p.solid != 0, static_cast<std::uint8_t>(p.material & kMaterialMask))) {
                return EngineError::InvalidOperation;
            }
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::Resize): {
            ResizePayload p;
            if (payloadByteCount != sizeof(ResizePayload) || !readPayload(payload, payloadByteCount, p)) {
                return EngineError::InvalidPayloadSize;
            }
            if (!self->resize(p.sizeX, p.sizeY, p.sizeZ)) return EngineError::InvalidOperation;
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::ResetSize): {
            if (payloadByteCount != 0) return EngineError::InvalidPayloadSize;
            self->resetSize();
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::SeedMaterials): {
            SeedMaterialsPayload p;
            if (payloadByteCount != sizeof(SeedMaterialsPayload) || !readPayload(payload, payloadByteCount, p)) {
                return EngineError::InvalidPayloadSize;
            }
            if (!self->seedMaterials(p.mode, p.seed)) return EngineError::InvalidOperation;
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::AddRegion): {
            AddRegionPayloadHeader hdr;
            if (!readPayload(payload, payloadByteCount, hdr)) return EngineError::InvalidPayloadSize;
            const std::size_t expected = sizeof(AddRegionPayloadHeader) + static_cast<std::size_t>(hdr.nameByteCount);
            if (expected != payloadByteCount) return EngineError::InvalidPayloadSize;
            const std::string name(reinterpret_cast<const char*>(payload + sizeof(AddRegionPayloadHeader)), hdr.nameByteCount);
            if (!self->addRegion(name, hdr.minX, hdr.minY, hdr.minZ, hdr.maxX, hdr.maxY, hdr.maxZ)) {
                return EngineError::InvalidOperation;
            }
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::ClearRegions): {
            if (payloadByteCount != 0) return EngineError::InvalidPayloadSize;
            self->clearRegions();
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::ApplyTool): {
            ApplyToolPayload p;
            if (payloadByteCount != sizeof(ApplyToolPayload) || !readPayload(payload, payloadByteCount, p)) {
                return EngineError::InvalidPayloadSize;
            }
            if (!validToolMode(p.mode) || !validToolOption(p.option)) return EngineError::InvalidOperation;
            self->applyTool(p.mode, p.option, p.voxel, p.face, p.material);
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::Shift): {
            ShiftPayload p;
            if (payloadByteCount != sizeof(ShiftPayload) || !readPayload(payload, payloadByteCount, p)) {
                return EngineError::InvalidPayloadSize;
            }
            self->shiftVoxels(p.dx, p.dy, p.dz);
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::SetPaletteSlot): {
            PaletteSlotPayload p;
            if (payloadByteCount != sizeof(PaletteSlotPayload) || !readPayload(payload, payloadByteCount, p)) {
                return EngineError::InvalidPayloadSize;
            }
            if (!PaletteSlots::validSlot(p.slot)) return EngineError::InvalidOperation;
            self->setPaletteColor(p.slot, p.r, p.g, p.b);
            break;
        }
        default:
            return EngineError::UnknownCommand;
    }
    return EngineError::Ok;
}

} // namespace voxcarve
