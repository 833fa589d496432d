#pragma once

#include <functional>
#include <string>

namespace cw {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Receives every message at or above the current level
using LogSink = std::function<void(LogLevel level, const std::string& msg)>;

// Replace the process-wide sink. An empty sink restores the stderr default.
void setLogSink(LogSink sink);
void setLogLevel(LogLevel level);
LogLevel logLevel();

const char* toString(LogLevel level);
LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::Info);

void log(LogLevel level, const char* format, ...) __attribute__((format(printf, 2, 3)));

// Route FFmpeg's av_log output through the sink (idempotent)
void installFfmpegLogBridge();

} // namespace cw
