#include "block_engine/log.hpp"

#include <cstdarg>
#include <cstdio>
#include <vector>

namespace block {

namespace {

LogLevel g_level = LogLevel::Warn;
LogSink g_sink;

void stderr_sink(LogLevel level, const char* category, const std::string& message) {
    std::fprintf(stderr, "[%s] %s: %s\n", category, log_level_name(level), message.c_str());
}

void vlog(LogLevel level, const char* category, const char* fmt, va_list args) {
    if (level < g_level || g_level == LogLevel::Off) return;

    va_list copy;
    va_copy(copy, args);
    int needed = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (needed < 0) return;

    std::vector<char> buf(static_cast<size_t>(needed) + 1);
    std::vsnprintf(buf.data(), buf.size(), fmt, args);
    std::string message(buf.data(), static_cast<size_t>(needed));

    if (g_sink) {
        g_sink(level, category, message);
    } else {
        stderr_sink(level, category, message);
    }
}

} // namespace

void set_log_level(LogLevel level) { g_level = level; }

LogLevel log_level() { return g_level; }

void set_log_sink(LogSink sink) { g_sink = std::move(sink); }

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    if (name == "debug") { out = LogLevel::Debug; return true; }
    if (name == "info") { out = LogLevel::Info; return true; }
    if (name == "warn" || name == "warning") { out = LogLevel::Warn; return true; }
    if (name == "error") { out = LogLevel::Error; return true; }
    if (name == "off") { out = LogLevel::Off; return true; }
    return false;
}

void log_debug(const char* category, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Debug, category, fmt, args);
    va_end(args);
}

void log_info(const char* category, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Info, category, fmt, args);
    va_end(args);
}

void log_warn(const char* category, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Warn, category, fmt, args);
    va_end(args);
}

void log_error(const char* category, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Error, category, fmt, args);
    va_end(args);
}

} // namespace block
