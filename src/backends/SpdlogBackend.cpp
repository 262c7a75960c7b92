#include "strata/backends/SpdlogBackend.h"
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace strata {

namespace {

constexpr const char* kLoggerName = "strata";
constexpr const char* kConsolePattern = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

}  // namespace

SpdlogBackend::SpdlogBackend(const std::string& logDir, bool logToFile) {
    // A previous backend may have registered the name already.
    spdlog::drop(kLoggerName);

    std::vector<spdlog::sink_ptr> sinks;
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern(kConsolePattern);
    sinks.push_back(console);

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        std::filesystem::path logPath = std::filesystem::path(logDir) / "strata.log";

        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
        file->set_pattern(kFilePattern);
        sinks.push_back(file);
    }

    logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    spdlog::register_logger(logger_);

    logger_->set_level(spdlog::level::debug);

    const char* envLevel = std::getenv("LOG_LEVEL");
    if (!envLevel) {
        envLevel = std::getenv("SPDLOG_LEVEL");
    }
    if (envLevel) {
        if (auto level = parseLogLevel(envLevel)) {
            logger_->set_level(convertLevel(*level));
        }
    }
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        [[maybe_unused]] const std::source_location& loc) {
    if (logger_) {
        logger_->log(convertLevel(level), message);
    }
}

void SpdlogBackend::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(convertLevel(level));
    }
}

void SpdlogBackend::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
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

}  // namespace strata
