#include "util/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace ontograph {
namespace logging {

namespace {

std::shared_ptr<spdlog::logger> createLogger() {
    // An application may have registered its own logger under our name
    if (auto existing = spdlog::get(kLoggerName)) return existing;
    auto logger = spdlog::stderr_color_mt(kLoggerName);
    LoggingConfig defaults;
    logger->set_level(defaults.level);
    logger->set_pattern(defaults.pattern);
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> get() {
    static std::shared_ptr<spdlog::logger> logger = createLogger();
    return logger;
}

void configure(const LoggingConfig& config) {
    auto logger = get();
    logger->set_level(config.level);
    logger->set_pattern(config.pattern);
}

} // namespace logging
} // namespace ontograph
