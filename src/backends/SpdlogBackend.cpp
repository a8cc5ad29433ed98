#include "nodeweave/backends/SpdlogBackend.h"

#include <cstdlib>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace nodeweave {

namespace {
constexpr const char* LOGGER_NAME = "nodeweave";
constexpr const char* CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
}  // namespace

SpdlogBackend::SpdlogBackend() {
    // A second backend in the same process reuses the registered logger.
    logger_ = spdlog::get(LOGGER_NAME);
    if (!logger_) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern(CONSOLE_PATTERN);
        logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, console);
        spdlog::register_logger(logger_);
    }

    LogLevel level = LogLevel::Debug;
    const char* env = std::getenv("LOG_LEVEL");
    if (!env) {
        env = std::getenv("SPDLOG_LEVEL");
    }
    if (env) {
        level = parseLogLevel(env, level);
    }
    logger_->set_level(toSpdlog(level));
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        [[maybe_unused]] const std::source_location& loc) {
    if (logger_) {
        logger_->log(toSpdlog(level), message);
    }
}

void SpdlogBackend::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(toSpdlog(level));
    }
}

void SpdlogBackend::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum SpdlogBackend::toSpdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::debug;
}

}  // namespace nodeweave
