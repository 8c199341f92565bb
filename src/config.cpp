#include "parafetch/config.hpp"

#include "parafetch/errors.hpp"

#include <fmt/format.h>

namespace parafetch {

void FetchConfig::validate() const {
    if (max_concurrent == 0) {
        throw ConfigError("max_concurrent must be a positive integer");
    }
    if (chunk_size == 0) {
        throw ConfigError("chunk_size must be a positive number of bytes");
    }
    if (max_retries < 0) {
        throw ConfigError(fmt::format("max_retries must not be negative (got {})", max_retries));
    }
    if (backoff_base.count() < 0.0) {
        throw ConfigError(fmt::format("backoff_base must not be negative (got {}s)", backoff_base.count()));
    }
    if (request_timeout.count() <= 0) {
        throw ConfigError("request_timeout must be positive");
    }
    if (download_dir.empty()) {
        throw ConfigError("download_dir must not be empty");
    }
}

std::vector<std::string> defaultBlocklist() {
    return {
        "youtube.com",
        "youtu.be",
        "vimeo.com",
        "facebook.com",
        "instagram.com",
        "tiktok.com",
        "twitter.com",
        "x.com",
    };
}

} // namespace parafetch
