#include "ViewportStreaming/Logging.h"

#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>

namespace vp_stream {
namespace {

LogLevel parseLevel(const char* text) {
    if (!text) return LogLevel::Off;
    std::string value(text);
    for (auto& c : value) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (value == "error") return LogLevel::Error;
    if (value == "warn" || value == "warning") return LogLevel::Warn;
    if (value == "info") return LogLevel::Info;
    if (value == "debug") return LogLevel::Debug;
    return LogLevel::Off;
}

std::atomic<LogLevel>& levelStorage() {
    // Environment is read once, on first use of the logger
    static std::atomic<LogLevel> level{parseLevel(std::getenv("VP_STREAM_LOG_LEVEL"))};
    return level;
}

std::mutex gLogMutex;
LogSink gSink;  // guarded by gLogMutex

const char* levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "[error] ";
        case LogLevel::Warn:  return "[warn ] ";
        case LogLevel::Info:  return "[info ] ";
        case LogLevel::Debug: return "[debug] ";
        default: return "";
    }
}
} // namespace

void setLogLevel(LogLevel level) {
    levelStorage().store(level, std::memory_order_relaxed);
}

LogLevel getLogLevel() {
    return levelStorage().load(std::memory_order_relaxed);
}

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(gLogMutex);
    gSink = std::move(sink);
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Off:   return "off";
        case LogLevel::Error: return "error";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Info:  return "info";
        case LogLevel::Debug: return "debug";
    }
    return "unknown";
}

void logMessage(LogLevel level, const char* fmt, ...) {
    if (level == LogLevel::Off) {
        return;
    }
    LogLevel current = getLogLevel();
    if (static_cast<int>(level) > static_cast<int>(current)) {
        return;
    }

    // Format into a thread-local buffer so the lock only covers the write
    thread_local char buffer[2048];

    va_list args;
    va_start(args, fmt);
    int len = std::vsnprintf(buffer, sizeof(buffer) - 1, fmt, args);
    va_end(args);

    if (len < 0) len = 0;
    if (len > static_cast<int>(sizeof(buffer) - 2)) len = static_cast<int>(sizeof(buffer) - 2);
    buffer[sizeof(buffer) - 1] = '\0';

    if (len > 0 && buffer[len - 1] == '\n') {
        buffer[len - 1] = '\0';
    }

    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gSink) {
        gSink(level, buffer);
        return;
    }
    std::fputs(levelTag(level), stderr);
    std::fputs(buffer, stderr);
    std::fputc('\n', stderr);
    std::fflush(stderr);
}

} // namespace vp_stream
