#pragma once

/**
 * @file negotiation_logger.hpp
 * @brief Debug tracing for negotiation rounds and provider calls.
 *
 * SECURITY WARNING: token bytes may carry credential material. Only enable
 * SECNEGO_DEBUG_NEGOTIATION for development builds.
 *
 * Enable via CMake: -DSECNEGO_DEBUG_NEGOTIATION=ON
 */

#include "secnego/enums/context_flags.hpp"
#include "secnego/enums/sec_status_code.hpp"

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>

namespace secnego::debug {

#ifdef SECNEGO_DEBUG_NEGOTIATION

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

/**
 * @brief Converts bytes to hex string, truncated for large tokens.
 */
inline std::string ToHexTruncated(std::span<const uint8_t> data, size_t max_bytes = 32) {
    if (data.size() <= max_bytes) {
        return ToHex(data);
    }
    auto truncated = ToHex(data.subspan(0, max_bytes));
    truncated += "...(" + std::to_string(data.size()) + " bytes)";
    return truncated;
}

// ============================================================================
// Core logging macros
// ============================================================================

#define SECNEGO_LOG_TOKEN(operation, name, data) \
    do { \
        fprintf(stdout, "[SECNEGO-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            ::secnego::debug::ToHexTruncated(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define SECNEGO_LOG_VALUE(operation, name, value) \
    do { \
        fprintf(stdout, "[SECNEGO-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define SECNEGO_LOG_STATUS(operation, call, status) \
    do { \
        fprintf(stdout, "[SECNEGO-DEBUG] %s %s -> %s (0x%08X)\n", \
            operation, \
            call, \
            ::secnego::auth::enums::ToString(status), \
            static_cast<uint32_t>(::secnego::auth::enums::ToNative(status))); \
        fflush(stdout); \
    } while(0)

#define SECNEGO_LOG_MSG(operation, message) \
    do { \
        fprintf(stdout, "[SECNEGO-DEBUG] %s %s\n", \
            operation, \
            message); \
        fflush(stdout); \
    } while(0)

#define SECNEGO_LOG_SECTION(section_name) \
    do { \
        fprintf(stdout, "[SECNEGO-DEBUG] ========== %s ==========\n", \
            section_name); \
        fflush(stdout); \
    } while(0)

// ============================================================================
// Round logging
// ============================================================================

inline void LogRoundStart(
    uint32_t round,
    bool has_previous_context,
    std::span<const uint8_t> inbound_token) {

    SECNEGO_LOG_SECTION("ACCEPT ROUND");
    SECNEGO_LOG_VALUE("ROUND", "index", round);
    SECNEGO_LOG_MSG("ROUND", has_previous_context ? "previous_context: YES" : "previous_context: NO");
    SECNEGO_LOG_TOKEN("ROUND", "inbound_token", inbound_token);
}

inline void LogRoundResult(
    uint32_t round,
    ::secnego::auth::enums::AcceptContextRetFlags flags,
    int64_t expiry,
    std::span<const uint8_t> outbound_token,
    bool done) {

    SECNEGO_LOG_VALUE("ROUND", "index", round);
    SECNEGO_LOG_VALUE("ROUND", "returned_flags", ::secnego::auth::enums::ToNative(flags));
    SECNEGO_LOG_VALUE("ROUND", "expiry", expiry);
    SECNEGO_LOG_TOKEN("ROUND", "outbound_token", outbound_token);
    SECNEGO_LOG_MSG("ROUND", done ? "done: YES" : "done: NO");
}

#else // !SECNEGO_DEBUG_NEGOTIATION

#define SECNEGO_LOG_TOKEN(operation, name, data) ((void)0)
#define SECNEGO_LOG_VALUE(operation, name, value) ((void)0)
#define SECNEGO_LOG_STATUS(operation, call, status) ((void)0)
#define SECNEGO_LOG_MSG(operation, message) ((void)0)
#define SECNEGO_LOG_SECTION(section_name) ((void)0)

inline void LogRoundStart(uint32_t, bool, std::span<const uint8_t>) {}
inline void LogRoundResult(uint32_t, ::secnego::auth::enums::AcceptContextRetFlags, int64_t,
    std::span<const uint8_t>, bool) {}

#endif // SECNEGO_DEBUG_NEGOTIATION

} // namespace secnego::debug
