#pragma once

#include <source_location>
#include <string>

namespace graphview {

/**
 * @brief Log level enumeration
 */
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/**
 * @brief Logger backend interface
 *
 * Implement this to route graphview logging into the host application's
 * logging system.
 *
 * @code
 * class HostLogger : public graphview::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         host->write(level, message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { host->setMinLevel(level); }
 *     void flush() override { host->flush(); }
 * };
 *
 * graphview::Logger::setBackend(std::make_unique<HostLogger>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace graphview
