#pragma once

#include "enginebox/logger.hh"

#ifndef ENGINEBOX_DEBUG_LOGS
#define ENGINEBOX_DEBUG_LOGS 0
#endif

inline constexpr bool debug_logs_enabled = ENGINEBOX_DEBUG_LOGS;

template <bool enabled, bool verbose_enabled = false>
struct DebugLogger {
    template <class... Args>
    void operator()(const Args&... args) const {
        if constexpr (enabled) {
            stdlog("[debug] ", args...);
        }
    }

    template <class... Args>
    void verbose(const Args&... args) const {
        if constexpr (enabled and verbose_enabled) {
            stdlog("[verbose] ", args...);
        }
    }
};
