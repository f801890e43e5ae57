#include "graphview/backends/DefaultBackend.h"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace graphview {

DefaultBackend::DefaultBackend() : currentLevel_(LogLevel::Info) {}

void DefaultBackend::log(LogLevel level, const std::string& message,
                         [[maybe_unused]] const std::source_location& loc) {
    if (level < currentLevel_ || currentLevel_ == LogLevel::Off) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stderr, "[%s] [%s%s\033[0m] %s\n",
                 timestamp().c_str(), levelToColor(level), levelToString(level), message.c_str());
}

void DefaultBackend::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

void DefaultBackend::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stderr);
}

const char* DefaultBackend::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "info";
}

const char* DefaultBackend::levelToColor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[37m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info: return "\033[32m";
        case LogLevel::Warn: return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Critical: return "\033[1;31m";
        case LogLevel::Off: return "";
    }
    return "";
}

std::string DefaultBackend::timestamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d",
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));
    return buf;
}

}  // namespace graphview
