#pragma once

#include <cstdio>

#ifndef VOXCARVE_ENABLE_LOGGING
#define VOXCARVE_ENABLE_LOGGING 0
#endif

#if VOXCARVE_ENABLE_LOGGING
#define VOXCARVE_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[voxcarve] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define VOXCARVE_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[voxcarve] warn: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define VOXCARVE_LOG_DEBUG(...) do { } while (0)
#define VOXCARVE_LOG_WARN(...) do { } while (0)
#endif
