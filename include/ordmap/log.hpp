#pragma once

/// @file log.hpp
/// @brief Pluggable diagnostics sink for ordmap.
///
/// The library reports through a process-wide callback. Until one is
/// installed, messages at or above the threshold go to stdout (errors to
/// stderr) as "[LEVEL] file:line - message".
///
/// @code
///   ordmap::set_log_callback([](ordmap::LogLevel lvl, const char* msg, void*) {
///       my_logger.write(static_cast<int>(lvl), msg);
///   }, nullptr);
///   ordmap::set_log_level(ordmap::LogLevel::Debug);
/// @endcode

#include "config.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstring>

namespace ordmap {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
};

/// @brief Log sink. `message` is a complete line including the trailing '\n'.
using LogCallback = void (*)(LogLevel level, const char* message, void* user_data);

inline const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

namespace detail {

struct LogState {
    LogCallback callback = nullptr;
    void* user_data = nullptr;
    LogLevel threshold = static_cast<LogLevel>(ORDMAP_DEFAULT_LOG_LEVEL);
};

inline LogState& log_state() noexcept {
    static LogState state;
    return state;
}

inline const char* basename(const char* path) noexcept {
    const char* slash = std::strrchr(path, '/');
    const char* bslash = std::strrchr(path, '\\');
    if (bslash != nullptr && (slash == nullptr || bslash > slash)) slash = bslash;
    return slash != nullptr ? slash + 1 : path;
}

inline void default_log_sink(LogLevel level, const char* message, void*) {
    std::FILE* out = level == LogLevel::Error ? stderr : stdout;
    std::fprintf(out, "[%-5s] %s", log_level_name(level), message);
    std::fflush(out);
}

} // namespace detail

/// @brief Install a log callback; nullptr restores the default sink.
inline void set_log_callback(LogCallback cb, void* user_data) noexcept {
    auto& state = detail::log_state();
    state.callback = cb;
    state.user_data = user_data;
}

/// @brief Messages below this level are dropped before formatting.
inline void set_log_level(LogLevel level) noexcept {
    detail::log_state().threshold = level;
}

[[nodiscard]] inline LogLevel log_level() noexcept {
    return detail::log_state().threshold;
}

ORDMAP_PRINTF_FORMAT(4, 5)
inline void log_printf(LogLevel level, const char* file, int line, const char* format, ...) {
    auto& state = detail::log_state();
    if (static_cast<int>(level) < static_cast<int>(state.threshold)) {
        return;
    }

    constexpr size_t kBufferSize = 1024;
    char buffer[kBufferSize + 2];
    int written = std::snprintf(buffer, kBufferSize, "%s:%-4d - ", detail::basename(file), line);
    if (written < 0) return;
    if (static_cast<size_t>(written) < kBufferSize) {
        va_list args;
        va_start(args, format);
        std::vsnprintf(buffer + written, kBufferSize - static_cast<size_t>(written), format, args);
        va_end(args);
    }
    size_t len = std::strlen(buffer);
    if (len == 0 || buffer[len - 1] != '\n') {
        buffer[len] = '\n';
        buffer[len + 1] = '\0';
    }

    if (state.callback != nullptr) {
        state.callback(level, buffer, state.user_data);
    } else {
        detail::default_log_sink(level, buffer, nullptr);
    }
}

} // namespace ordmap

#define ORDMAP_LOG_DEBUG(format, ...) ::ordmap::log_printf(::ordmap::LogLevel::Debug, __FILE__, __LINE__, format, ##__VA_ARGS__)
#define ORDMAP_LOG_INFO(format, ...)  ::ordmap::log_printf(::ordmap::LogLevel::Info, __FILE__, __LINE__, format, ##__VA_ARGS__)
#define ORDMAP_LOG_WARN(format, ...)  ::ordmap::log_printf(::ordmap::LogLevel::Warn, __FILE__, __LINE__, format, ##__VA_ARGS__)
#define ORDMAP_LOG_ERROR(format, ...) ::ordmap::log_printf(::ordmap::LogLevel::Error, __FILE__, __LINE__, format, ##__VA_ARGS__)
