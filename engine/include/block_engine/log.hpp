#pragma once

#include <functional>
#include <string>

#if defined(__GNUC__) || defined(__clang__)
#define BLOCK_ENGINE_PRINTF(fmt_index, args_index) __attribute__((format(printf, fmt_index, args_index)))
#else
#define BLOCK_ENGINE_PRINTF(fmt_index, args_index)
#endif

namespace block {

// Leveled, category-tagged logging. Records below the threshold are dropped
// before formatting.
enum class LogLevel {
    Debug = 20,
    Info = 40,
    Warn = 80,
    Error = 100,
    Off = 1000
};

// Receives every record that passes the threshold. The default sink writes
// "[category] message" lines to stderr.
using LogSink = std::function<void(LogLevel level, const char* category, const std::string& message)>;

void set_log_level(LogLevel level);
LogLevel log_level();

// An empty sink restores the stderr default.
void set_log_sink(LogSink sink);

const char* log_level_name(LogLevel level);
bool parse_log_level(const std::string& name, LogLevel& out);

void log_debug(const char* category, const char* fmt, ...) BLOCK_ENGINE_PRINTF(2, 3);
void log_info(const char* category, const char* fmt, ...) BLOCK_ENGINE_PRINTF(2, 3);
void log_warn(const char* category, const char* fmt, ...) BLOCK_ENGINE_PRINTF(2, 3);
void log_error(const char* category, const char* fmt, ...) BLOCK_ENGINE_PRINTF(2, 3);

} // namespace block
