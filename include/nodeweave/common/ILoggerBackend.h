#pragma once

#include <source_location>
#include <string>

namespace nodeweave {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/// Parses "trace", "debug", "info", "warn"/"warning", "err"/"error",
/// "critical" and "off" (case-insensitive). Unknown text yields fallback.
LogLevel parseLogLevel(const std::string& text, LogLevel fallback);

/**
 * @brief Sink interface behind the Logger facade
 *
 * Hosts that already own a logging system implement this and hand it to
 * Logger::setBackend(). The message arrives fully formatted and prefixed
 * with the calling function name.
 *
 * @code
 * class HostSink : public nodeweave::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         host_->write(int(level), message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { host_->setMin(int(level)); }
 *     void flush() override { host_->flush(); }
 * };
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

}  // namespace nodeweave
