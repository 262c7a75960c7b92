#pragma once

#include "strata/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace strata {

/**
 * @brief Process-wide logging facade used by every layout phase
 *
 * The backend is chosen at build time (SpdlogBackend with STRATA_USE_SPDLOG,
 * DefaultBackend otherwise) unless the host injects one with setBackend().
 * Messages are prefixed with the calling function's name.
 *
 * Capture mode keeps a copy of each line in memory so tests can assert on
 * diagnostics such as skipped edges:
 * @code
 * strata::Logger::enableCapture(true);
 * strata::layoutDagreish(g);
 * auto warnings = strata::Logger::getCapturedLogs("[warn]");
 * @endcode
 */
class Logger {
public:
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /// Console-only default backend. No-op if a backend is already installed.
    static void initialize();

    /**
     * @brief Default backend writing to the console and to logDir/strata.log
     * @param logDir Created if missing
     * @param logToFile false keeps console output only
     */
    static void initialize(const std::string& logDir, bool logToFile = true);

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

    /**
     * @brief Captured lines, oldest first
     * @param pattern Substring filter, empty for all
     * @param maxLines Keep only the newest N matches (0 = all)
     */
    static std::vector<std::string> getCapturedLogs(const std::string& pattern = "",
                                                    size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;

    static void ensureBackend();
    static void emit(LogLevel level, const std::string& message,
                     const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& line);
};

}  // namespace strata

#define LOG_TRACE(...) strata::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) strata::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  strata::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  strata::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) strata::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
