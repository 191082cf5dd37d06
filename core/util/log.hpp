#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace ontograph {

// ─── LoggingConfig ─────────────────────────────────────────────

struct LoggingConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
};

namespace logging {

/// Name of the library logger.
inline constexpr const char* kLoggerName = "ontograph";

/// The library logger, created on first use with a colour stderr sink.
std::shared_ptr<spdlog::logger> get();

/// Applies level and pattern to the library logger.
void configure(const LoggingConfig& config);

} // namespace logging
} // namespace ontograph
