// Log.cpp: leveled printf-style logging shared by all components
#include "cw/Log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <iostream>
#include <mutex>

extern "C" {
#include <libavutil/log.h>
}

namespace cw {

namespace {

std::mutex g_sinkMutex;
LogSink g_sink;
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

void defaultSink(LogLevel level, const std::string& msg) {
    std::cerr << "[" << toString(level) << "] " << msg << std::endl;
}

void emit(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    if (g_sink)
        g_sink(level, msg);
    else
        defaultSink(level, msg);
}

void ffmpegCallback(void* avcl, int level, const char* fmt, va_list vl) {
    // FFmpeg is chatty below warnings; only forward what we would show anyway
    if (level > AV_LOG_WARNING)
        return;
    LogLevel mapped = level <= AV_LOG_ERROR ? LogLevel::Error : LogLevel::Warn;
    if (static_cast<int>(mapped) < g_level.load())
        return;

    char line[1024];
    int printPrefix = 1;
    av_log_format_line2(avcl, level, fmt, vl, line, sizeof(line), &printPrefix);
    std::string msg(line);
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r'))
        msg.pop_back();
    if (msg.empty())
        return;
    emit(mapped, "[ffmpeg] " + msg);
}

} // namespace

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    g_sink = std::move(sink);
}

void setLogLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel logLevel() {
    return static_cast<LogLevel>(g_level.load());
}

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

LogLevel parseLogLevel(const std::string& name, LogLevel fallback) {
    if (name == "debug" || name == "DEBUG") return LogLevel::Debug;
    if (name == "info" || name == "INFO") return LogLevel::Info;
    if (name == "warn" || name == "warning" || name == "WARN") return LogLevel::Warn;
    if (name == "error" || name == "ERROR") return LogLevel::Error;
    return fallback;
}

void log(LogLevel level, const char* format, ...) {
    if (static_cast<int>(level) < g_level.load())
        return;
    char buffer[2048];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    emit(level, buffer);
}

void installFfmpegLogBridge() {
    static std::once_flag once;
    std::call_once(once, [] { av_log_set_callback(ffmpegCallback); });
}

} // namespace cw
