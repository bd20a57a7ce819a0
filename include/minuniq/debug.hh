#pragma once

#include "minuniq/logger.hh"

#include <utility>

// Logs to errlog only if enabled at compile time
template <bool enabled>
struct DebugLogger {
    template <class... Args>
    void operator()(Args&&... args) const {
        if constexpr (enabled) {
            errlog(std::forward<Args>(args)...);
        }
    }
};
