#pragma once

#include <polyexec/logger.hh>

// E.g. use:
// static DebugLogger<true> debuglog;
// debuglog("sth: ", sth);
template <bool enable>
struct DebugLogger {
    static constexpr bool is_enabled = enable;

    template <class... Args>
    void operator()(Args&&... args) const noexcept {
        if constexpr (is_enabled) {
            stdlog("\033[33m", std::forward<Args>(args)..., "\033[m");
        }
    }
};
