#ifndef VOXCARVE_COMMAND_COMMANDS_H
#define VOXCARVE_COMMAND_COMMANDS_H

#include "voxcarve/core/types.h"
#include <cstdint>
#include <cstddef>

namespace voxcarve {

using CommandCallback = EngineError(*)(void* ctx, std::uint32_t op, std::uint32_t id, const std::uint8_t* payload, std::uint32_t payloadByteCount);

// Parse a VXCB command buffer and invoke the callback for each command.
// Stops at the first error; commands before it have already been delivered.
EngineError parseCommandBuffer(const std::uint8_t* src, std::uint32_t byteCount, CommandCallback cb, void* ctx);

} // namespace voxcarve

#endif // VOXCARVE_COMMAND_COMMANDS_H
