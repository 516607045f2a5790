#pragma once

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace plonkish {
namespace debug {

/**
 * Diagnostics switches, read once from the environment:
 * - PLONKISH_PROFILE=1|true: synthesis, shape derivation and check timings
 * - PLONKISH_DEBUG=1|true: region placement and verification failures
 */

inline bool env_flag_enabled(const char* name) {
    const char* env = std::getenv(name);
    return env && (strcmp(env, "1") == 0 || strcmp(env, "true") == 0);
}

inline bool is_profile_enabled() {
    static const bool enabled = env_flag_enabled("PLONKISH_PROFILE");
    return enabled;
}

inline bool is_debug_enabled() {
    static const bool enabled = env_flag_enabled("PLONKISH_DEBUG");
    return enabled;
}

} // namespace debug
} // namespace plonkish

#define PLONKISH_PROFILE_PRINT(...) \
    do { \
        if (plonkish::debug::is_profile_enabled()) { \
            printf(__VA_ARGS__); \
        } \
    } while(0)

#define PLONKISH_DEBUG_PRINT(...) \
    do { \
        if (plonkish::debug::is_debug_enabled()) { \
            printf(__VA_ARGS__); \
        } \
    } while(0)

#define PLONKISH_IF_DEBUG if (plonkish::debug::is_debug_enabled())
