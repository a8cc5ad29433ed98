#pragma once

#include "nodeweave/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace nodeweave {

/**
 * @brief spdlog backend writing to a color console sink
 *
 * Default backend when NODEWEAVE_USE_SPDLOG=ON. The level starts at debug
 * and can be overridden with LOG_LEVEL or SPDLOG_LEVEL.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend();

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;

    static spdlog::level::level_enum toSpdlog(LogLevel level);
};

}  // namespace nodeweave
