// Lightweight logging and failure-step hooks shared by the receive chain.
#pragma once
#include <atomic>
#include <cstdio>
#include <cstdlib>

namespace droneid { namespace debug {

// Failure codes recorded by the per-burst helpers on their failure paths.
enum FailStep : int {
    kNone              = 0,
    kOffsetMismatch    = 1,
    kRateTooLow        = 2,
    kTruncatedBurst    = 3,
    kWeakCorrelation   = 4,
    kShortSymbolStream = 5,
    kNoPhase           = 6,
    kTextDecode        = 7,
};

inline thread_local int last_fail_step = kNone; // set by RX helpers on failure paths
inline void set_fail(int code) { last_fail_step = code; }
inline void clear_fail() { last_fail_step = kNone; }

inline std::atomic<bool>& enabled_flag() {
    static std::atomic<bool> flag{std::getenv("DRONEID_DEBUG") != nullptr};
    return flag;
}
inline bool enabled() { return enabled_flag().load(std::memory_order_relaxed); }
// DRONEID_DEBUG in the environment keeps logging on regardless of config.
inline void set_enabled(bool on) {
    enabled_flag().store(on || std::getenv("DRONEID_DEBUG") != nullptr, std::memory_order_relaxed);
}

} } // namespace droneid::debug

#define DRONEID_LOGF(fmt, ...) std::fprintf(stderr, "[droneid] " fmt "\n", ##__VA_ARGS__)
#define DRONEID_DEBUGF(fmt, ...)                                                   \
    do {                                                                           \
        if (::droneid::debug::enabled())                                           \
            std::fprintf(stderr, "[DEBUG] " fmt "\n", ##__VA_ARGS__);              \
    } while (0)
