#pragma once

#include "strata/common/ILoggerBackend.h"
#include <mutex>

namespace strata {

/**
 * @brief Dependency-free backend writing colored lines to stdout
 *
 * Used when the library is built without STRATA_USE_SPDLOG. Honours the
 * LOG_LEVEL environment variable like SpdlogBackend; the default level is
 * Info.
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

    static const char* levelToColor(LogLevel level);
    static std::string getTimestamp();
};

}  // namespace strata
