#include "strata/backends/DefaultBackend.h"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <format>

namespace strata {

DefaultBackend::DefaultBackend() : currentLevel_(LogLevel::Info) {
    if (const char* envLevel = std::getenv("LOG_LEVEL")) {
        if (auto level = parseLogLevel(envLevel)) {
            currentLevel_ = *level;
        }
    }
}

void DefaultBackend::log(LogLevel level, const std::string& message,
                         [[maybe_unused]] const std::source_location& loc) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < currentLevel_ || currentLevel_ == LogLevel::Off) {
        return;
    }
    std::fprintf(stdout, "[%s] [%s%s\033[0m] %s\n", getTimestamp().c_str(),
                 levelToColor(level), logLevelName(level), message.c_str());
}

void DefaultBackend::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

void DefaultBackend::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
}

const char* DefaultBackend::levelToColor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[37m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info: return "\033[32m";
        case LogLevel::Warn: return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Critical: return "\033[1;31m";
        case LogLevel::Off: return "";
    }
    return "";
}

std::string DefaultBackend::getTimestamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t t = system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&t, &local);
    return std::format("{:02}:{:02}:{:02}.{:03}", local.tm_hour, local.tm_min, local.tm_sec,
                       static_cast<int>(ms.count()));
}

}  // namespace strata
