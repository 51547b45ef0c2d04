#include "voxcarve/command/commands.h"
#include "voxcarve/core/util.h"
#include "voxcarve/core/logging.h"

namespace voxcarve {

EngineError parseCommandBuffer(const std::uint8_t* src, std::uint32_t byteCount, CommandCallback cb, void* ctx) {
    if (!src || byteCount < commandHeaderBytes) {
        return EngineError::BufferTruncated;
    }

    const std::uint32_t magic = readU32(src, 0);
    if (magic != commandMagicVxcb) {
        VOXCARVE_LOG_WARN("command buffer: bad magic 0x%08x", magic);
        return EngineError::InvalidMagic;
    }
    const std::uint32_t version = readU32(src, 4);
    if (version != commandVersionVxcb) {
        VOXCARVE_LOG_WARN("command buffer: unsupported version %u", version);
        return EngineError::UnsupportedVersion;
    }
    const std::uint32_t commandCount = readU32(src, 8);

    std::size_t o = commandHeaderBytes;
    for (std::uint32_t i = 0; i < commandCount; i++) {
        if (o > byteCount || perCommandHeaderBytes > (byteCount - o)) {
            return EngineError::BufferTruncated;
        }
        const std::uint32_t op = readU32(src, o); o += 4;
        const std::uint32_t id = readU32(src, o); o += 4;
        const std::uint32_t payloadByteCount = readU32(src, o); o += 4;
        o += 4; // reserved

        if (payloadByteCount > (byteCount - o)) {
            return EngineError::BufferTruncated;
        }

        const std::uint8_t* payload = src + o;
        if (cb) {
            const EngineError err = cb(ctx, op, id, payload, payloadByteCount);
            if (err != EngineError::Ok) {
                VOXCARVE_LOG_WARN("command buffer: op %u (#%u) failed with %u", op, i, static_cast<std::uint32_t>(err));
                return err;
            }
        }

        o += payloadByteCount;
    }

    return EngineError::Ok;
}

} // namespace voxcarve
