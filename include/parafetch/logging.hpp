#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/common.h>
#include <spdlog/logger.h>

namespace parafetch {

inline constexpr const char* kLoggerName = "parafetch";

struct LoggingOptions {
    spdlog::level::level_enum console_level{spdlog::level::warn};
    std::optional<std::filesystem::path> log_file;
    // Remote collector; records are POSTed as JSON lines.
    std::optional<std::string> endpoint;
    std::filesystem::path spool_file{"parafetch-log.spool"};
    std::chrono::milliseconds retry_interval{std::chrono::seconds(5)};
};

// The library logger. Falls back to a stderr logger at warn level when
// setupLogging() has not been called.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// Replaces the library logger. Throws spdlog::spdlog_ex if a sink cannot be
// opened.
void setupLogging(const LoggingOptions& options);

} // namespace parafetch
