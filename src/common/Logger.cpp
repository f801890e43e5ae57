#include "graphview/common/Logger.h"

#ifdef GRAPHVIEW_USE_SPDLOG
#include "graphview/backends/SpdlogBackend.h"
#else
#include "graphview/backends/DefaultBackend.h"
#endif

#include <mutex>

namespace graphview {

std::unique_ptr<ILoggerBackend> Logger::backend_;
static std::mutex backend_mutex;

static bool capture_enabled_ = false;
static std::vector<std::string> captured_logs_;
static std::mutex capture_mutex_;

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
#ifdef GRAPHVIEW_USE_SPDLOG
        backend_ = std::make_unique<SpdlogBackend>();
#else
        backend_ = std::make_unique<DefaultBackend>();
#endif
    }
}

void Logger::initialize([[maybe_unused]] const std::string& logDir,
                        [[maybe_unused]] bool logToFile) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
#ifdef GRAPHVIEW_USE_SPDLOG
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
#else
        backend_ = std::make_unique<DefaultBackend>();
#endif
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::trace(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Trace, "trace", message, loc);
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Debug, "debug", message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Info, "info", message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Warn, "warn", message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Error, "error", message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

void Logger::dispatch(LogLevel level, const char* tag, const std::string& message,
                      const std::source_location& loc) {
    ensureBackend();
    std::string enhanced = functionName(loc) + "() - " + message;
    backend_->log(level, enhanced, loc);

    std::lock_guard<std::mutex> lock(capture_mutex_);
    if (capture_enabled_) {
        captured_logs_.push_back(std::string("[") + tag + "] " + enhanced);
    }
}

// ===== Log Capture =====

void Logger::enableCapture(bool enable) {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    capture_enabled_ = enable;
}

bool Logger::isCaptureEnabled() {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    return capture_enabled_;
}

std::vector<std::string> Logger::getCapturedLogs(const std::string& pattern, size_t maxLines) {
    std::lock_guard<std::mutex> lock(capture_mutex_);

    std::vector<std::string> result;
    for (const auto& line : captured_logs_) {
        if (pattern.empty() || line.find(pattern) != std::string::npos) {
            result.push_back(line);
        }
    }

    if (maxLines > 0 && result.size() > maxLines) {
        result.erase(result.begin(), result.begin() + (result.size() - maxLines));
    }
    return result;
}

void Logger::clearCapturedLogs() {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    captured_logs_.clear();
}

std::string Logger::functionName(const std::source_location& loc) {
    // "void graphview::GraphView::update(graphview::ViewSession&, ...)" -> "GraphView::update"
    std::string full = loc.function_name();
    size_t paren = full.find('(');
    if (paren == std::string::npos) {
        return "Unknown";
    }
    std::string head = full.substr(0, paren);

    size_t space = head.rfind(' ');
    if (space != std::string::npos) {
        head = head.substr(space + 1);
    }

    constexpr std::string_view prefix = "graphview::";
    if (head.starts_with(prefix)) {
        head = head.substr(prefix.size());
    }
    return head.empty() ? "Unknown" : head;
}

}  // namespace graphview
