#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace parafetch {

struct FetchConfig {
    std::size_t max_concurrent{5};
    std::size_t chunk_size{8192};
    std::filesystem::path download_dir{"downloads"};
    int max_retries{3};
    std::chrono::duration<double> backoff_base{1.0};
    std::chrono::milliseconds request_timeout{std::chrono::seconds(30)};
    std::vector<std::string> blocklist;

    // Throws ConfigError describing the first invalid field.
    void validate() const;
};

// Hosts whose URLs are web pages rather than downloadable files.
[[nodiscard]] std::vector<std::string> defaultBlocklist();

} // namespace parafetch
