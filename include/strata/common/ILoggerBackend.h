#pragma once

#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace strata {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/// Parse "trace", "debug", "info", "warn"/"warning", "err"/"error",
/// "critical" or "off", case-insensitively.
std::optional<LogLevel> parseLogLevel(std::string_view text);

const char* logLevelName(LogLevel level);

/**
 * @brief Sink for layout diagnostics
 *
 * The layout phases report through Logger; implement this to route those
 * messages into a host application's own logging.
 *
 * @code
 * class HostLog : public strata::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         host_->write(level, message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { host_->setMinLevel(level); }
 *     void flush() override { host_->flush(); }
 * };
 *
 * strata::Logger::setBackend(std::make_unique<HostLog>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /// @param message Already formatted, prefixed with the calling function
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace strata
