#ifndef VOXCARVE_CORE_UTIL_H
#define VOXCARVE_CORE_UTIL_H

#include <cstdint>
#include <cstddef>
#include <cstring>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
#endif

namespace voxcarve {

inline double nowMs() {
#ifdef EMSCRIPTEN
    return emscripten_get_now();
#else
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
#endif
}

static inline std::uint32_t readU32(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint32_t v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline void writeU32LE(std::uint8_t* dst, std::size_t offset, std::uint32_t v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

// Copy a POD payload out of an unaligned command stream.
template <typename T>
static inline bool readPayload(const std::uint8_t* payload, std::uint32_t byteCount, T& out) noexcept {
    if (byteCount < sizeof(T)) return false;
    std::memcpy(&out, payload, sizeof(T));
    return true;
}

} // namespace voxcarve

#endif // VOXCARVE_CORE_UTIL_H
