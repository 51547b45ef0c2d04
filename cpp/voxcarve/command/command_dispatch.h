#pragma once

#include "voxcarve/core/types.h"
#include <cstdint>

class CarveEngine;

namespace voxcarve {

/**
 * Applies one parsed command to the engine. Acts as the callback for
 * parseCommandBuffer; the caller owns the surrounding history entry.
 */
EngineError dispatchCommand(
    CarveEngine* engine,
    std::uint32_t op,
    std::uint32_t id,
    const std::uint8_t* payload,
    std::uint32_t payloadByteCount
);

} // namespace voxcarve
