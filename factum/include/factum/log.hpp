#pragma once
// Logging: timestamped, component-tagged lines on stderr
//
//   [14:02:11.093][sqlite] Opened store at /tmp/facts.db
//
// Debug lines are dropped unless verbose mode is on. Info and error lines
// are always written.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>

namespace factum {

namespace detail {

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> verbose{false};
    return verbose;
}

inline void log_line(const char* component, const char* level,
                     const char* fmt, va_list args) {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::tm local_tm{};
    localtime_r(&now_time_t, &local_tm);
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local_tm);

    std::fprintf(stderr, "[%s.%03d][%s] %s", time_buf,
                 static_cast<int>(now_ms.count()), component, level);
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

} // namespace detail

inline void set_verbose(bool verbose) { detail::verbose_flag() = verbose; }
inline bool verbose() { return detail::verbose_flag(); }

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose()) return;

    va_list args;
    va_start(args, fmt);
    detail::log_line(component, "", fmt, args);
    va_end(args);
}

inline void log_info(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::log_line(component, "", fmt, args);
    va_end(args);
}

inline void log_error(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::log_line(component, "ERROR: ", fmt, args);
    va_end(args);
}

} // namespace factum
