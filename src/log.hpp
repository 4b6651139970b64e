#pragma once

#include <atomic>
#include <cstdio>
#include <format>
#include <print>
#include <string_view>
#include <utility>

// Process-wide stderr logging. Every line is prefixed with "[subtitle-ai]".
namespace logging {

enum class Level { Debug, Info, Warn, Error };

inline std::atomic<Level>& threshold() {
    static std::atomic<Level> level{Level::Info};
    return level;
}

inline void set_level(Level level) { threshold().store(level, std::memory_order_relaxed); }

inline bool enabled(Level level) {
    return level >= threshold().load(std::memory_order_relaxed);
}

inline void write(Level level, std::string_view msg) {
    if (!enabled(level)) return;
    switch (level) {
        case Level::Warn:
            std::println(stderr, "[subtitle-ai] warning: {}", msg);
            break;
        case Level::Error:
            std::println(stderr, "[subtitle-ai] error: {}", msg);
            break;
        default:
            std::println(stderr, "[subtitle-ai] {}", msg);
            break;
    }
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Debug)) write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Info)) write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    write(Level::Warn, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace logging
