#include "parafetch/logging.hpp"

#include "parafetch/log_spool_sink.hpp"

#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace parafetch {

namespace {

std::mutex& registryMutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }

    std::lock_guard<std::mutex> lock(registryMutex());
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto fallback = spdlog::stderr_color_mt(kLoggerName);
    fallback->set_level(spdlog::level::warn);
    return fallback;
}

void setupLogging(const LoggingOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_level(options.console_level);
    sinks.push_back(console);

    if (options.log_file) {
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file->string());
        file->set_level(spdlog::level::debug);
        sinks.push_back(file);
    }

    if (options.endpoint) {
        auto remote = std::make_shared<HttpSpoolSink>(*options.endpoint, options.spool_file, options.retry_interval);
        remote->set_level(spdlog::level::info);
        sinks.push_back(remote);
    }

    auto configured = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    configured->set_level(spdlog::level::debug);
    configured->flush_on(spdlog::level::err);

    std::lock_guard<std::mutex> lock(registryMutex());
    spdlog::drop(kLoggerName);
    spdlog::register_logger(configured);
}

} // namespace parafetch
