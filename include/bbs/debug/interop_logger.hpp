#pragma once

/**
 * @file interop_logger.hpp
 * @brief Debug tracing of native boundary traffic.
 *
 * Logs protocol steps, buffer registration/release and native failures to
 * stdout. Only names, lengths and codes are printed, never buffer contents.
 * Disabled unless BBS_DEBUG_INTEROP is defined.
 *
 * Enable via CMake: -DBBS_DEBUG_INTEROP=ON
 */

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string_view>

namespace bbs::debug {

enum class Direction {
    Register,
    Release
};

#ifdef BBS_DEBUG_INTEROP

inline const char* DirectionToString(Direction direction) {
    switch (direction) {
        case Direction::Register: return "REGISTER";
        case Direction::Release: return "RELEASE";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Core logging macros
// ============================================================================

#define BBS_LOG_STEP(operation, step, status) \
    do { \
        const std::string_view bbs_log_op_ = (operation); \
        const std::string_view bbs_log_step_ = (step); \
        fprintf(stdout, "[BBS-DEBUG] %.*s %.*s -> %d\n", \
            static_cast<int>(bbs_log_op_.size()), bbs_log_op_.data(), \
            static_cast<int>(bbs_log_step_.size()), bbs_log_step_.data(), \
            static_cast<int>(status)); \
        fflush(stdout); \
    } while(0)

#define BBS_LOG_BUFFER(direction, origin, length) \
    do { \
        const std::string_view bbs_log_origin_ = (origin); \
        fprintf(stdout, "[BBS-DEBUG] %s %.*s (%zu bytes)\n", \
            ::bbs::debug::DirectionToString(direction), \
            static_cast<int>(bbs_log_origin_.size()), bbs_log_origin_.data(), \
            static_cast<size_t>(length)); \
        fflush(stdout); \
    } while(0)

#define BBS_LOG_FAILURE(code, message) \
    do { \
        const std::string_view bbs_log_msg_ = (message); \
        fprintf(stdout, "[BBS-DEBUG] FAILURE code=%d: %.*s\n", \
            static_cast<int>(code), \
            static_cast<int>(bbs_log_msg_.size()), bbs_log_msg_.data()); \
        fflush(stdout); \
    } while(0)

inline void LogScopeClosed(const size_t registered, const size_t released) {
    fprintf(stdout, "[BBS-DEBUG] scope closed: %zu registered, %zu released\n",
        registered, released);
    fflush(stdout);
}

#else // !BBS_DEBUG_INTEROP

#define BBS_LOG_STEP(operation, step, status) ((void)0)
#define BBS_LOG_BUFFER(direction, origin, length) ((void)0)
#define BBS_LOG_FAILURE(code, message) ((void)0)

inline void LogScopeClosed(size_t, size_t) {}

#endif // BBS_DEBUG_INTEROP

} // namespace bbs::debug
