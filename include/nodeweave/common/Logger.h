#pragma once

#include "nodeweave/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace nodeweave {

/**
 * @brief Process-wide logging facade used by every engine module
 *
 * The backend is created lazily (spdlog when built with NODEWEAVE_USE_SPDLOG,
 * DefaultBackend otherwise) unless the host injects its own. Each message
 * is prefixed with the calling function name, e.g. "Louvain::run() - ...".
 *
 * Capture mode keeps a copy of every line in memory, which the tests use to
 * check that degenerate input was reported:
 * @code
 * nodeweave::Logger::enableCapture(true);
 * auto result = ForceLayout::layoutStep(graph, positions, options, 10.0f);
 * auto warnings = nodeweave::Logger::getCapturedLogs("[warn]");
 * @endcode
 */
class Logger {
public:
    /// Replace the backend (ownership transferred).
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /// Create the default console backend if none is set.
    static void initialize();

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

    // ===== Capture =====

    static void enableCapture(bool enable);
    static bool isCaptureEnabled();

    /// Captured lines containing pattern (all when empty), newest maxLines
    /// when maxLines > 0. Lines look like "[warn] Func() - message".
    static std::vector<std::string> getCapturedLogs(const std::string& pattern = "",
                                                    size_t maxLines = 0);
    static void clearCapturedLogs();

    /// "ns::Class::method" from a source location, "Unknown" when absent.
    static std::string functionName(const std::source_location& loc);

private:
    static void dispatch(LogLevel level, const std::string& message,
                         const std::source_location& loc);
};

}  // namespace nodeweave

// Logging macros with std::format support
#define LOG_TRACE(...) nodeweave::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) nodeweave::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  nodeweave::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  nodeweave::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) nodeweave::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
