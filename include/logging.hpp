#pragma once

#include <cstdint>

enum class LogLevel : uint8_t {
    Debug = 0,
    Info,
    Warn,
    Error,
    None,
};

// Receives every line that passes the level filter. The default sink writes
// "[LEVEL][tag] message" to stderr.
using LogSink = void(*)(LogLevel level, const char* tag, const char* message);

void init_logging(LogLevel level = LogLevel::Info);
void set_log_level(LogLevel level);
LogLevel log_level();
void set_log_sink(LogSink sink);
const char* log_level_name(LogLevel level);

void log_debug(const char* tag, const char* fmt, ...);
void log_info(const char* tag, const char* fmt, ...);
void log_warn(const char* tag, const char* fmt, ...);
void log_error(const char* tag, const char* fmt, ...);
