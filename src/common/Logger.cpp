#include "nodeweave/common/Logger.h"

#ifdef NODEWEAVE_USE_SPDLOG
#include "nodeweave/backends/SpdlogBackend.h"
#else
#include "nodeweave/backends/DefaultBackend.h"
#endif

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <mutex>

namespace nodeweave {

namespace {

struct LoggerState {
    std::mutex backendMutex;
    std::unique_ptr<ILoggerBackend> backend;

    std::mutex captureMutex;
    bool captureEnabled = false;
    std::vector<std::string> captured;
};

LoggerState& state() {
    static LoggerState instance;
    return instance;
}

const char* captureTag(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "[trace] ";
        case LogLevel::Debug: return "[debug] ";
        case LogLevel::Info: return "[info] ";
        case LogLevel::Warn: return "[warn] ";
        case LogLevel::Error: return "[error] ";
        case LogLevel::Critical: return "[critical] ";
        case LogLevel::Off: break;
    }
    return "";
}

std::unique_ptr<ILoggerBackend> makeDefaultBackend() {
#ifdef NODEWEAVE_USE_SPDLOG
    return std::make_unique<SpdlogBackend>();
#else
    return std::make_unique<DefaultBackend>();
#endif
}

}  // namespace

LogLevel parseLogLevel(const std::string& text, LogLevel fallback) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "err" || lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return fallback;
}

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(state().backendMutex);
    state().backend = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(state().backendMutex);
    if (!state().backend) {
        state().backend = makeDefaultBackend();
    }
}

void Logger::setLevel(LogLevel level) {
    initialize();
    std::lock_guard<std::mutex> lock(state().backendMutex);
    state().backend->setLevel(level);
}

void Logger::trace(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Error, message, loc);
}

void Logger::flush() {
    initialize();
    std::lock_guard<std::mutex> lock(state().backendMutex);
    state().backend->flush();
}

void Logger::dispatch(LogLevel level, const std::string& message,
                      const std::source_location& loc) {
    initialize();
    const std::string line = functionName(loc) + "() - " + message;
    {
        std::lock_guard<std::mutex> lock(state().backendMutex);
        state().backend->log(level, line, loc);
    }

    std::lock_guard<std::mutex> lock(state().captureMutex);
    if (state().captureEnabled) {
        state().captured.push_back(captureTag(level) + line);
    }
}

// ===== Capture =====

void Logger::enableCapture(bool enable) {
    std::lock_guard<std::mutex> lock(state().captureMutex);
    state().captureEnabled = enable;
}

bool Logger::isCaptureEnabled() {
    std::lock_guard<std::mutex> lock(state().captureMutex);
    return state().captureEnabled;
}

std::vector<std::string> Logger::getCapturedLogs(const std::string& pattern, size_t maxLines) {
    std::lock_guard<std::mutex> lock(state().captureMutex);

    std::vector<std::string> result;
    std::copy_if(state().captured.begin(), state().captured.end(), std::back_inserter(result),
                 [&pattern](const std::string& line) {
                     return pattern.empty() || line.find(pattern) != std::string::npos;
                 });

    if (maxLines > 0 && result.size() > maxLines) {
        result.erase(result.begin(), result.end() - static_cast<std::ptrdiff_t>(maxLines));
    }
    return result;
}

void Logger::clearCapturedLogs() {
    std::lock_guard<std::mutex> lock(state().captureMutex);
    state().captured.clear();
}

std::string Logger::functionName(const std::source_location& loc) {
    const std::string signature = loc.function_name();

    const size_t paren = signature.find('(');
    if (paren == std::string::npos) {
        return "Unknown";
    }

    // The name starts after the last top-level space before the parameter
    // list; template argument lists are dropped.
    std::string name;
    int depth = 0;
    for (size_t i = 0; i < paren; ++i) {
        const char c = signature[i];
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            --depth;
        } else if (depth == 0) {
            if (c == ' ') {
                name.clear();
            } else if (c != '*' && c != '&') {
                name += c;
            }
        }
    }
    return name.empty() ? "Unknown" : name;
}

}  // namespace nodeweave
