#include "logging.hpp"
#include <cstdarg>
#include <cstddef>
#include <cstdio>

namespace {
constexpr std::size_t kMaxLogLine = 256;

LogLevel g_level = LogLevel::Info;

void stderr_sink(LogLevel level, const char* tag, const char* message) {
    std::fprintf(stderr, "[%s][%s] %s\n", log_level_name(level), tag, message);
}

LogSink g_sink = stderr_sink;

void log_write(LogLevel level, const char* tag, const char* fmt, std::va_list args) {
    if (level < g_level || g_level == LogLevel::None) {
        return;
    }
    char line[kMaxLogLine];
    std::vsnprintf(line, sizeof(line), fmt, args);
    g_sink(level, tag ? tag : "-", line);
}
} // namespace

void init_logging(LogLevel level) {
    g_level = level;
    g_sink = stderr_sink;
}

void set_log_level(LogLevel level) {
    g_level = level;
}

LogLevel log_level() {
    return g_level;
}

void set_log_sink(LogSink sink) {
    g_sink = sink ? sink : stderr_sink;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::None: return "NONE";
    }
    return "?";
}

void log_debug(const char* tag, const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    log_write(LogLevel::Debug, tag, fmt, args);
    va_end(args);
}

void log_info(const char* tag, const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    log_write(LogLevel::Info, tag, fmt, args);
    va_end(args);
}

void log_warn(const char* tag, const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    log_write(LogLevel::Warn, tag, fmt, args);
    va_end(args);
}

void log_error(const char* tag, const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    log_write(LogLevel::Error, tag, fmt, args);
    va_end(args);
}
