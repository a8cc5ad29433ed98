#pragma once

#include "nodeweave/common/ILoggerBackend.h"
#include <mutex>

namespace nodeweave {

/**
 * @brief Dependency-free stdout backend
 *
 * Used when the library is built without NODEWEAVE_USE_SPDLOG. Lines are
 * timestamped (HH:MM:SS.mmm) and the level tag is ANSI colored. Honors the
 * LOG_LEVEL environment variable at construction.
 */
class DefaultBackend : public ILoggerBackend {
public:
    DefaultBackend();

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    LogLevel currentLevel_;
    std::mutex mutex_;

    static const char* levelTag(LogLevel level);
    static const char* levelColor(LogLevel level);
    static std::string timestamp();
};

}  // namespace nodeweave
