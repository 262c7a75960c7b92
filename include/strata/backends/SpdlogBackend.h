#pragma once

#include "strata/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace strata {

/**
 * @brief spdlog backend, the default when STRATA_USE_SPDLOG=ON
 *
 * Registers a logger named "strata". Console output always; with a log
 * directory, a truncating file sink at logDir/strata.log as well.
 * LOG_LEVEL (or SPDLOG_LEVEL) overrides the initial debug level.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;

    static spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace strata
