#include "strata/common/Logger.h"

#ifdef STRATA_USE_SPDLOG
#include "strata/backends/SpdlogBackend.h"
#else
#include "strata/backends/DefaultBackend.h"
#endif

#include <algorithm>
#include <cctype>
#include <mutex>

namespace strata {

std::unique_ptr<ILoggerBackend> Logger::backend_;
static std::mutex backend_mutex;

static bool capture_enabled_ = false;
static std::vector<std::string> captured_logs_;
static std::mutex capture_mutex_;

std::optional<LogLevel> parseLogLevel(std::string_view text) {
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
    return std::nullopt;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
#ifdef STRATA_USE_SPDLOG
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
#ifdef STRATA_USE_SPDLOG
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

void Logger::emit(LogLevel level, const std::string& message, const std::source_location& loc) {
    ensureBackend();
    std::string line = extractFunctionName(loc) + "() - " + message;
    backend_->log(level, line, loc);
    captureLog(std::string("[") + logLevelName(level) + "] " + line);
}

void Logger::trace(const std::string& message, const std::source_location& loc) {
    emit(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    emit(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    emit(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    emit(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    emit(LogLevel::Error, message, loc);
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

// ===== Capture =====

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

void Logger::captureLog(const std::string& line) {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    if (capture_enabled_) {
        captured_logs_.push_back(line);
    }
}

// "void strata::algorithms::NetworkSimplex::run(LayoutGraph&)" -> "strata::algorithms::NetworkSimplex::run"
std::string Logger::extractFunctionName(const std::source_location& loc) {
    std::string full = loc.function_name();

    size_t paren = full.find('(');
    if (paren == std::string::npos) {
        return "Unknown";
    }

    int depth = 0;
    size_t lastSpace = std::string::npos;
    for (size_t i = 0; i < paren; ++i) {
        char c = full[i];
        if (c == '<') ++depth;
        else if (c == '>') --depth;
        else if (c == ' ' && depth == 0) lastSpace = i;
    }
    size_t start = lastSpace == std::string::npos ? 0 : lastSpace + 1;

    std::string name;
    depth = 0;
    for (size_t i = start; i < paren; ++i) {
        char c = full[i];
        if (c == '<') ++depth;
        else if (c == '>') --depth;
        else if (depth == 0) name += c;
    }

    size_t first = name.find_first_not_of(" *&");
    if (first == std::string::npos) {
        return "Unknown";
    }
    size_t last = name.find_last_not_of(' ');
    return name.substr(first, last - first + 1);
}

}  // namespace strata
