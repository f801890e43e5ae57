#include "graphview/backends/SpdlogBackend.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace graphview {

SpdlogBackend::SpdlogBackend(const std::string& logDir, bool logToFile) {
    if (logDir.empty() && !logToFile) {
        logger_ = spdlog::get("graphview");
        if (!logger_) {
            logger_ = spdlog::stdout_color_mt("graphview");
        }
        logger_->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    } else {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);

        if (logToFile && !logDir.empty()) {
            std::filesystem::create_directories(logDir);
            std::filesystem::path logPath = std::filesystem::path(logDir) / "graphview.log";

            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                logPath.string(), true);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        logger_ = std::make_shared<spdlog::logger>("graphview", sinks.begin(), sinks.end());
        spdlog::drop("graphview");
        spdlog::register_logger(logger_);
    }

    logger_->set_level(spdlog::level::debug);

    const char* env_level = std::getenv("LOG_LEVEL");
    if (!env_level) {
        env_level = std::getenv("SPDLOG_LEVEL");
    }

    if (env_level) {
        std::string level_str(env_level);
        std::transform(level_str.begin(), level_str.end(), level_str.begin(), ::tolower);
        if (level_str == "warning") level_str = "warn";
        if (level_str == "error") level_str = "err";
        // spdlog maps unknown names to "off"; keep the default in that case
        auto parsed = spdlog::level::from_str(level_str);
        if (parsed != spdlog::level::off || level_str == "off") {
            logger_->set_level(parsed);
        }
    }
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        const std::source_location& loc) {
    if (logger_) {
        spdlog::source_loc where{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()};
        logger_->log(where, convertLevel(level), message);
    }
}

void SpdlogBackend::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(convertLevel(level));
    }
}

void SpdlogBackend::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
        default: return spdlog::level::debug;
    }
}

}  // namespace graphview
