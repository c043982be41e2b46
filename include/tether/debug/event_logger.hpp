#pragma once

/**
 * @file event_logger.hpp
 * @brief Diagnostic tracing for pairing, key derivation and message lifecycle.
 *
 * Compiled in only with -DTETHER_DEBUG_EVENTS=ON. Identifiers are printed as
 * short fingerprints; key material and plaintext are never printed.
 */

#include <cstdio>
#include <string>
#include <string_view>

#ifdef TETHER_DEBUG_EVENTS
#include <fmt/core.h>
#endif

namespace tether::debug {

#ifdef TETHER_DEBUG_EVENTS

inline std::string Fingerprint(std::string_view value, const size_t keep = 10) {
    if (value.size() <= keep) {
        return std::string(value);
    }
    return fmt::format("{}..({})", value.substr(0, keep), value.size());
}

#define TETHER_LOG_MSG(component, message) \
    do { \
        fprintf(stderr, "[TETHER] %-8s %s\n", component, message); \
        fflush(stderr); \
    } while(0)

#define TETHER_LOG_VALUE(component, name, value) \
    do { \
        fprintf(stderr, "[TETHER] %-8s %s = %s\n", \
            component, \
            name, \
            ::fmt::format("{}", value).c_str()); \
        fflush(stderr); \
    } while(0)

#define TETHER_LOG_ID(component, name, id) \
    do { \
        fprintf(stderr, "[TETHER] %-8s %s: %s\n", \
            component, \
            name, \
            ::tether::debug::Fingerprint(id).c_str()); \
        fflush(stderr); \
    } while(0)

#define TETHER_LOG_FAILURE(component, failure) \
    do { \
        fprintf(stderr, "[TETHER] %-8s failed: %s\n", \
            component, \
            (failure).ToString().c_str()); \
        fflush(stderr); \
    } while(0)

#else // !TETHER_DEBUG_EVENTS

#define TETHER_LOG_MSG(component, message) ((void)0)
#define TETHER_LOG_VALUE(component, name, value) ((void)0)
#define TETHER_LOG_ID(component, name, id) ((void)0)
#define TETHER_LOG_FAILURE(component, failure) ((void)0)

#endif // TETHER_DEBUG_EVENTS

}
