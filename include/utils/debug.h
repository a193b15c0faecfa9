#pragma once

#ifdef NESTSH_ENABLE_DEBUG

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <chrono>

namespace nestsh {

static inline int debug_enabled(void) {
    const char* value = getenv("NESTSH_DEBUG");
    return value != NULL && value[0] == '1' && value[1] == '\0';
}

static inline void debug_msg(const char* fmt, ...) {
    if (!debug_enabled()) {
        return;
    }

    va_list args;
    va_start(args, fmt);
    fputs("[DEBUG] ", stderr);
    vfprintf(stderr, fmt, args);
    va_end(args);
    fputc('\n', stderr);
    fflush(stderr);
}

class PerformanceTracker {
   public:
    explicit PerformanceTracker(const char* label) : label_(label), enabled_(debug_enabled()) {
        if (enabled_) {
            start_time_ = std::chrono::steady_clock::now();
        }
    }

    ~PerformanceTracker() {
        if (!enabled_) {
            return;
        }

        auto end_time = std::chrono::steady_clock::now();
        auto duration = end_time - start_time_;
        auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(duration).count();

        if (microseconds < 1000) {
            debug_msg("PerformanceTracker [%s]: %lld us", label_,
                      static_cast<long long>(microseconds));
        } else {
            double milliseconds = static_cast<double>(microseconds) / 1000.0;
            debug_msg("PerformanceTracker [%s]: %.3f ms", label_, milliseconds);
        }
    }

   private:
    const char* label_;
    bool enabled_{false};
    std::chrono::steady_clock::time_point start_time_{};
};

}  // namespace nestsh

#else

namespace nestsh {

static inline int debug_enabled(void) {
    return 0;
}

static inline void debug_msg(const char* fmt, ...) {
    (void)fmt;
}

class PerformanceTracker {
   public:
    explicit PerformanceTracker(const char* label) {
        (void)label;
    }

    ~PerformanceTracker() {
    }
};

}  // namespace nestsh

#endif
