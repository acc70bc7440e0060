#pragma once

#include <cstdarg>
#include <functional>

namespace vp_stream {

enum class LogLevel : int {
    Off = 0,
    Error = 1,
    Warn = 2,
    Info = 3,
    Debug = 4
};

// Set global log level. The initial level comes from VP_STREAM_LOG_LEVEL
// (off|error|warn|info|debug) and is Off when the variable is unset.
void setLogLevel(LogLevel level);

// Get current global log level.
LogLevel getLogLevel();

// Redirect formatted lines (without level tag) to a custom sink. Pass an empty
// function to restore stderr output.
using LogSink = std::function<void(LogLevel, const char*)>;
void setLogSink(LogSink sink);

// printf-style logger; no-op when level is above current threshold.
void logMessage(LogLevel level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

const char* logLevelName(LogLevel level);

} // namespace vp_stream
