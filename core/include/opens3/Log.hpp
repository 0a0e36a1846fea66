// Diagnostics for the transfer queues: admission, executor outcomes, engine
// events that arrive too late and history write failures. Off unless
// OPENS3_LOG is set to something other than 0; output goes to stderr.
#pragma once
#include <cstdio>
#include <cstdlib>
#include <cstdarg>

namespace opens3 {

inline bool logEnabled() {
    const char* v = std::getenv("OPENS3_LOG");
    return v && *v && *v != '0';
}

inline void logf(const char* level, const char* fmt, ...) {
    if (!logEnabled()) return;
    std::fprintf(stderr, "[OpenS3][%s] ", level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

} // namespace opens3

#define LOGI(fmt, ...) \
    do { \
        if (opens3::logEnabled()) \
            opens3::logf("INFO", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGW(fmt, ...) \
    do { \
        if (opens3::logEnabled()) \
            opens3::logf("WARN", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGE(fmt, ...) \
    do { \
        if (opens3::logEnabled()) \
            opens3::logf("ERROR", fmt, ##__VA_ARGS__); \
    } while (0)
