#pragma once

#include "graphview/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace graphview {

/**
 * @brief Static logging facade
 *
 * Uses SpdlogBackend when built with GRAPHVIEW_USE_SPDLOG, DefaultBackend
 * otherwise. A custom backend can be injected with setBackend().
 *
 * Capture mode keeps a copy of every message in memory so tests can assert
 * on what was logged:
 * @code
 * graphview::Logger::enableCapture(true);
 * LOG_WARN("node {} not found", id);
 * auto lines = graphview::Logger::getCapturedLogs("not found");
 * @endcode
 */
class Logger {
public:
    /// Inject a backend (ownership transferred)
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /// Initialize the default backend (console only)
    static void initialize();

    /// Initialize the default backend with an optional log file in logDir
    static void initialize(const std::string& logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    static void flush();

    // ===== Log Capture API =====

    static void enableCapture(bool enable);
    static bool isCaptureEnabled();

    /**
     * @brief Captured lines containing pattern (all lines if empty)
     * @param maxLines Keep only the last maxLines matches (0 = unlimited)
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void dispatch(LogLevel level, const char* tag, const std::string& message,
                         const std::source_location& loc);
    static std::string functionName(const std::source_location& loc);
};

}  // namespace graphview

#define LOG_TRACE(...) graphview::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) graphview::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  graphview::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  graphview::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) graphview::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
